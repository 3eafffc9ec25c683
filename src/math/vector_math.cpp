#include "bytepath/math/vector_math.hpp"

#include <algorithm>
#include <cmath>

namespace {
constexpr float LengthEpsilon = 1e-6f;
}

Vector::Vector() : x(0), y(0) {}
Vector::Vector(float x, float y) : x(x), y(y) {}

Vector Vector::fromAngle(float radians) {
  return {std::cos(radians), std::sin(radians)};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(float scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(float scalar) const {
  return {this->x / scalar, this->y / scalar};
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Vector& Vector::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

float Vector::length() const {
  return std::sqrt(this->x * this->x + this->y * this->y);
}

float Vector::distance(const Vector& p) const {
  return (*this - p).length();
}

float Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::perp() const {
  return {-this->y, this->x};
}

Vector Vector::normalized() const {
  float const len = this->length();
  if (len > LengthEpsilon) {
    return {this->x / len, this->y / len};
  }
  return {1.0f, 0.0f};
}

float Vector::angleBetween(const Vector& other) const {
  float const lenProduct = this->length() * other.length();
  if (lenProduct < LengthEpsilon) {
    return 0.0f;
  }
  float dotVal = this->dotProduct(other) / lenProduct;
  dotVal = std::max(-1.0f, std::min(1.0f, dotVal));
  return std::acos(dotVal);
}

float signedSteeringAngle(float heading, const Vector& toTarget) {
  Vector const forward = Vector::fromAngle(heading);
  float const unsignedAngle = forward.angleBetween(toTarget);
  // perp() of the forward vector is the heading + pi/2 direction
  Vector const right = forward.perp();
  return right.dotProduct(toTarget) >= 0.0f ? unsignedAngle : -unsignedAngle;
}
