#include "common/math/Geodesy.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace skyshot::geo {
namespace {

constexpr int kGeodeticIterations = 12;

}  // namespace

double DegToRad(double deg) { return deg * std::numbers::pi / 180.0; }

double RadToDeg(double rad) { return rad * 180.0 / std::numbers::pi; }

double NormalizeHeading(double deg) {
  double wrapped = std::fmod(deg, 360.0);
  if (wrapped < 0.0) {
    wrapped += 360.0;
  }
  // fmod of a tiny negative value can round back up to exactly 360.
  if (wrapped >= 360.0) {
    wrapped = 0.0;
  }
  return wrapped;
}

double WrapLongitude(double deg) {
  return NormalizeHeading(deg + 180.0) - 180.0;
}

double AngleDelta(double a_deg, double b_deg) {
  return NormalizeHeading(b_deg - a_deg + 180.0) - 180.0;
}

bool IsValid(const GeoPoint& point) {
  return std::isfinite(point.latitude_deg) && std::isfinite(point.longitude_deg) &&
         point.latitude_deg >= -90.0 && point.latitude_deg <= 90.0 &&
         point.longitude_deg >= -180.0 && point.longitude_deg <= 180.0;
}

double GreatCircleDistance(const GeoPoint& a, const GeoPoint& b) {
  const double lat1 = DegToRad(a.latitude_deg);
  const double lat2 = DegToRad(b.latitude_deg);
  const double dlat = lat2 - lat1;
  const double dlon = DegToRad(b.longitude_deg - a.longitude_deg);
  const double s_lat = std::sin(dlat / 2.0);
  const double s_lon = std::sin(dlon / 2.0);
  const double h = std::clamp(s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon,
                              0.0, 1.0);
  return 2.0 * kEarthMeanRadiusM * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double InitialBearing(const GeoPoint& from, const GeoPoint& to) {
  const double lat1 = DegToRad(from.latitude_deg);
  const double lat2 = DegToRad(to.latitude_deg);
  const double dlon = DegToRad(to.longitude_deg - from.longitude_deg);
  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  return NormalizeHeading(RadToDeg(std::atan2(y, x)));
}

GeoPoint Destination(const GeoPoint& origin, double bearing_deg, double distance_m) {
  const double delta = distance_m / kEarthMeanRadiusM;
  const double theta = DegToRad(bearing_deg);
  const double lat1 = DegToRad(origin.latitude_deg);
  const double lon1 = DegToRad(origin.longitude_deg);

  const double sin_lat2 = std::clamp(
      std::sin(lat1) * std::cos(delta) + std::cos(lat1) * std::sin(delta) * std::cos(theta),
      -1.0, 1.0);
  const double lat2 = std::asin(sin_lat2);
  const double lon2 = lon1 + std::atan2(std::sin(theta) * std::sin(delta) * std::cos(lat1),
                                        std::cos(delta) - std::sin(lat1) * sin_lat2);

  return GeoPoint{RadToDeg(lat2), WrapLongitude(RadToDeg(lon2))};
}

Eigen::Vector3d GeodeticToEcef(const Geodetic& point) {
  const double lat = DegToRad(point.latitude_deg);
  const double lon = DegToRad(point.longitude_deg);
  const double sin_lat = std::sin(lat);
  const double cos_lat = std::cos(lat);
  const double n = kWgs84A / std::sqrt(1.0 - kWgs84E2 * sin_lat * sin_lat);
  return Eigen::Vector3d((n + point.altitude_m) * cos_lat * std::cos(lon),
                         (n + point.altitude_m) * cos_lat * std::sin(lon),
                         (n * (1.0 - kWgs84E2) + point.altitude_m) * sin_lat);
}

Geodetic EcefToGeodetic(const Eigen::Vector3d& ecef) {
  const double x = ecef.x();
  const double y = ecef.y();
  const double z = ecef.z();
  const double lon = std::atan2(y, x);
  const double p = std::hypot(x, y);
  double lat = std::atan2(z, p * (1.0 - kWgs84E2));

  for (int i = 0; i < kGeodeticIterations; ++i) {
    const double sin_lat = std::sin(lat);
    const double n = kWgs84A / std::sqrt(1.0 - kWgs84E2 * sin_lat * sin_lat);
    lat = std::atan2(z + kWgs84E2 * n * sin_lat, p);
  }

  const double sin_lat = std::sin(lat);
  const double cos_lat = std::cos(lat);
  const double n = kWgs84A / std::sqrt(1.0 - kWgs84E2 * sin_lat * sin_lat);
  double altitude = 0.0;
  if (std::fabs(cos_lat) > 1e-10) {
    altitude = p / cos_lat - n;
  } else {
    altitude = std::fabs(z) - kWgs84B;
  }
  return Geodetic{RadToDeg(lat), RadToDeg(lon), altitude};
}

Eigen::Matrix3d EcefToEnuRotation(const Geodetic& anchor) {
  const double lat = DegToRad(anchor.latitude_deg);
  const double lon = DegToRad(anchor.longitude_deg);
  const double sl = std::sin(lat);
  const double cl = std::cos(lat);
  const double so = std::sin(lon);
  const double co = std::cos(lon);

  Eigen::Matrix3d rotation;
  rotation << -so, co, 0.0,
              -sl * co, -sl * so, cl,
              cl * co, cl * so, sl;
  return rotation;
}

Eigen::Vector3d GeodeticToEnu(const Geodetic& point, const Geodetic& anchor) {
  const Eigen::Vector3d delta = GeodeticToEcef(point) - GeodeticToEcef(anchor);
  return EcefToEnuRotation(anchor) * delta;
}

Geodetic EnuToGeodetic(const Eigen::Vector3d& enu, const Geodetic& anchor) {
  const Eigen::Vector3d ecef =
      GeodeticToEcef(anchor) + EcefToEnuRotation(anchor).transpose() * enu;
  return EcefToGeodetic(ecef);
}

}  // namespace skyshot::geo
