#include "boxigon/math/vector_math.hpp"

#include <cmath>

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector Vector::operator-() const {
    return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
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

Vector& Vector::operator*=(double scalar) {
    this->x *= scalar;
    this->y *= scalar;
    return *this;
}

bool Vector::operator==(const Vector& v) const {
    return this->x == v.x && this->y == v.y;
}

bool Vector::operator!=(const Vector& v) const {
    return !(*this == v);
}

double Vector::length() const {
	return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::lengthSquared() const {
	return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
	return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector &other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
}

bool Vector::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y);
}
