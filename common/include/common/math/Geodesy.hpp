#pragma once

#include <Eigen/Core>

namespace skyshot::geo {

// Mean Earth radius used for every spherical (great-circle) computation.
inline constexpr double kEarthMeanRadiusM = 6371008.8;

// WGS84 ellipsoid, used for ECEF and local tangent plane conversions.
inline constexpr double kWgs84A = 6378137.0;
inline constexpr double kWgs84F = 1.0 / 298.257223563;
inline constexpr double kWgs84B = kWgs84A * (1.0 - kWgs84F);
inline constexpr double kWgs84E2 = 2.0 * kWgs84F - kWgs84F * kWgs84F;

struct GeoPoint {
  double latitude_deg{0.0};
  double longitude_deg{0.0};
};

struct Geodetic {
  double latitude_deg{0.0};
  double longitude_deg{0.0};
  double altitude_m{0.0};

  GeoPoint horizontal() const { return GeoPoint{latitude_deg, longitude_deg}; }
};

double DegToRad(double deg);
double RadToDeg(double rad);

// Maps any finite angle into [0, 360).
double NormalizeHeading(double deg);
// Maps any finite angle into [-180, 180).
double WrapLongitude(double deg);
// Signed shortest angular difference b - a in [-180, 180).
double AngleDelta(double a_deg, double b_deg);

bool IsValid(const GeoPoint& point);

// Haversine distance on the mean-radius sphere.
double GreatCircleDistance(const GeoPoint& a, const GeoPoint& b);
// Initial bearing from a to b, clockwise from north, in [0, 360).
double InitialBearing(const GeoPoint& from, const GeoPoint& to);
// Point reached travelling distance_m along the great circle with the given
// initial bearing.
GeoPoint Destination(const GeoPoint& origin, double bearing_deg, double distance_m);

Eigen::Vector3d GeodeticToEcef(const Geodetic& point);
Geodetic EcefToGeodetic(const Eigen::Vector3d& ecef);

// Rotation taking ECEF deltas into the east-north-up frame at the anchor.
Eigen::Matrix3d EcefToEnuRotation(const Geodetic& anchor);

// East-north-up offset of point relative to anchor, in metres. This is the
// transform the preview viewer applies, so exports must go through it.
Eigen::Vector3d GeodeticToEnu(const Geodetic& point, const Geodetic& anchor);
Geodetic EnuToGeodetic(const Eigen::Vector3d& enu, const Geodetic& anchor);

}  // namespace skyshot::geo
