#ifndef RANDOM_PROVIDER_H
#define RANDOM_PROVIDER_H

/**
 * @file RandomProvider.h
 * @brief Source of randomness for the rand / randf / random intrinsics
 *
 * The parser binds a provider into every random-intrinsic node it creates.
 * A single evaluation may substitute another provider through its
 * EvalContext (see Formula::evaluate).
 *
 *   DefaultRandomProvider: per-thread generator, safe to share
 *   SeededRandomProvider:  reproducible sequence, one instance per thread
 *   FixedRandomProvider:   constant value, for tests
 */

#include <QRandomGenerator>
#include <QtGlobal>
#include <memory>

class RandomProvider {
public:
    virtual ~RandomProvider() = default;

    // Uniform value in [0, 1)
    virtual double uniform01() = 0;

    // Uniform value in [0, max); 0 when max <= 0
    virtual double uniformBelow(double max) = 0;

    // Uniform integer in [0, max); 0 when max <= 0
    virtual int uniformIntBelow(int max) = 0;
};

using RandomProviderPtr = std::shared_ptr<RandomProvider>;

// ═══════════════════════════════════════════════════════════════════
// DEFAULT: one generator per calling thread
// ═══════════════════════════════════════════════════════════════════

class DefaultRandomProvider : public RandomProvider {
public:
    double uniform01() override;
    double uniformBelow(double max) override;
    int uniformIntBelow(int max) override;

    // Shared process-wide instance used when a parser gets no provider
    static RandomProviderPtr shared();

private:
    static QRandomGenerator &threadGenerator();
};

// ═══════════════════════════════════════════════════════════════════
// SEEDED: deterministic sequence
// ═══════════════════════════════════════════════════════════════════

class SeededRandomProvider : public RandomProvider {
public:
    explicit SeededRandomProvider(quint32 seed);

    double uniform01() override;
    double uniformBelow(double max) override;
    int uniformIntBelow(int max) override;

    quint32 seed() const { return m_seed; }

private:
    quint32          m_seed;
    QRandomGenerator m_generator;
};

// ═══════════════════════════════════════════════════════════════════
// FIXED: always the same value (tests)
// ═══════════════════════════════════════════════════════════════════

class FixedRandomProvider : public RandomProvider {
public:
    explicit FixedRandomProvider(double fixedValue = 0.5);

    double uniform01() override;
    double uniformBelow(double max) override;
    // int(value * max), clamped to [0, max - 1]
    int uniformIntBelow(int max) override;

    double fixedValue() const { return m_fixedValue; }

private:
    double m_fixedValue;
};

#endif // RANDOM_PROVIDER_H
