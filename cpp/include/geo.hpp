#pragma once

#include "route_types.hpp"

constexpr double kEarthRadiusKm = 6371.0;

// Haversine great-circle distance in kilometers. Symmetric, zero for equal coordinates.
double distance_km(const Location& a, const Location& b);
