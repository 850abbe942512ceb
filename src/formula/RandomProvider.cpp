#include "formula/RandomProvider.h"

// ═══════════════════════════════════════════════════════════════════
// DefaultRandomProvider
// ═══════════════════════════════════════════════════════════════════

QRandomGenerator &DefaultRandomProvider::threadGenerator() {
  thread_local QRandomGenerator generator(
      QRandomGenerator::system()->generate());
  return generator;
}

double DefaultRandomProvider::uniform01() {
  return threadGenerator().generateDouble();
}

double DefaultRandomProvider::uniformBelow(double max) {
  if (max <= 0.0)
    return 0.0;
  return threadGenerator().generateDouble() * max;
}

int DefaultRandomProvider::uniformIntBelow(int max) {
  if (max <= 0)
    return 0;
  return threadGenerator().bounded(max);
}

RandomProviderPtr DefaultRandomProvider::shared() {
  static RandomProviderPtr s_instance =
      std::make_shared<DefaultRandomProvider>();
  return s_instance;
}

// ═══════════════════════════════════════════════════════════════════
// SeededRandomProvider
// ═══════════════════════════════════════════════════════════════════

SeededRandomProvider::SeededRandomProvider(quint32 seed)
    : m_seed(seed), m_generator(seed) {}

double SeededRandomProvider::uniform01() { return m_generator.generateDouble(); }

double SeededRandomProvider::uniformBelow(double max) {
  if (max <= 0.0)
    return 0.0;
  return m_generator.generateDouble() * max;
}

int SeededRandomProvider::uniformIntBelow(int max) {
  if (max <= 0)
    return 0;
  return m_generator.bounded(max);
}

// ═══════════════════════════════════════════════════════════════════
// FixedRandomProvider
// ═══════════════════════════════════════════════════════════════════

FixedRandomProvider::FixedRandomProvider(double fixedValue)
    : m_fixedValue(fixedValue) {}

double FixedRandomProvider::uniform01() { return m_fixedValue; }

double FixedRandomProvider::uniformBelow(double max) {
  if (max <= 0.0)
    return 0.0;
  return m_fixedValue * max;
}

int FixedRandomProvider::uniformIntBelow(int max) {
  if (max <= 0)
    return 0;

  // Keep the product inside [0, max - 1] before converting; NaN maps to 0
  double scaled = m_fixedValue * max;
  if (!(scaled >= 0.0))
    return 0;
  if (scaled >= static_cast<double>(max))
    return max - 1;
  return static_cast<int>(scaled);
}
