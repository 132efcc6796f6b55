#pragma once

#include <random>

namespace trackcast {

class Rng {
public:
  virtual ~Rng() = default;

  virtual double uniform(double min, double max) = 0;
};

class StandardRng : public Rng {
public:
  StandardRng() : gen_(std::random_device{}()) {}
  explicit StandardRng(unsigned int seed) : gen_(seed) {}

  double uniform(double min, double max) override {
    std::uniform_real_distribution<double> dist(min, max);
    return dist(gen_);
  }

private:
  std::mt19937 gen_;
};

struct Coordinate {
  double lat{0.0};
  double lon{0.0};
};

// independent uniform offset in [-radius, radius] on each axis
Coordinate jitter(double lat, double lon, double radius, Rng &rng);

} // namespace trackcast
