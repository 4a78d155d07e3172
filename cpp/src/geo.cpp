#include "geo.hpp"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;

double radians(double deg) { return deg * kPi / 180.0; }
}

double distance_km(const Location& a, const Location& b) {
  const double dlat = radians(b.lat - a.lat);
  const double dlon = radians(b.lon - a.lon);
  const double s_lat = std::sin(dlat / 2.0);
  const double s_lon = std::sin(dlon / 2.0);

  double h = s_lat * s_lat + std::cos(radians(a.lat)) * std::cos(radians(b.lat)) * s_lon * s_lon;
  // rounding can push h just outside [0, 1]
  h = std::clamp(h, 0.0, 1.0);

  return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double Location::distance_to(const Location& other) const { return distance_km(*this, other); }
