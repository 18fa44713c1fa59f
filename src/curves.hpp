/*
    ABC - augmented bonding curve sale engine
    Copyright (C) 2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef ABC_CURVES_HPP
#define ABC_CURVES_HPP

#include "decimal.hpp"
#include "decimalplaces.hpp"

#include "database/amount.hpp"

#include <string>

namespace abc
{

/**
 * The different kinds of pricing curves that are supported.  This is a
 * closed set, and all code dispatching on it handles every value.
 */
enum class CurveKind
{

  /** Fixed price, independent of the supply.  */
  CONSTANT,

  /** Price grows linearly with the supply.  */
  LINEAR,

  /** Price grows with the square root of the supply.  */
  SQUARE_ROOT,

};

/**
 * Returns the name of a curve kind, e.g. for logging.
 */
std::string CurveKindToString (CurveKind kind);

/**
 * A type of curve together with its parameter.  The parameter is a
 * coefficient given as integer and a decimal scale, so that the actual
 * value is coefficient / 10^scale:
 *
 *  - for CONSTANT, this is the price,
 *  - for LINEAR and SQUARE_ROOT, the slope.
 */
class CurveType
{

private:

  /** The kind of curve.  */
  CurveKind kind;

  /** The coefficient (value or slope).  */
  Amount coefficient;

  /** The decimal scale applied to the coefficient.  */
  unsigned scale;

  explicit CurveType (CurveKind k, const Amount& c, unsigned s)
    : kind(k), coefficient(c), scale(s)
  {}

public:

  /** Maximum supported value for the scale.  */
  static constexpr unsigned MAX_SCALE = 28;

  CurveType (const CurveType&) = default;
  CurveType& operator= (const CurveType&) = default;

  static CurveType
  Constant (const Amount& value, const unsigned scale)
  {
    return CurveType (CurveKind::CONSTANT, value, scale);
  }

  static CurveType
  Linear (const Amount& slope, const unsigned scale)
  {
    return CurveType (CurveKind::LINEAR, slope, scale);
  }

  static CurveType
  SquareRoot (const Amount& slope, const unsigned scale)
  {
    return CurveType (CurveKind::SQUARE_ROOT, slope, scale);
  }

  CurveKind
  GetKind () const
  {
    return kind;
  }

  const Amount&
  GetCoefficient () const
  {
    return coefficient;
  }

  unsigned
  GetScale () const
  {
    return scale;
  }

  /**
   * Checks if the parameters are valid (non-zero coefficient and scale
   * within range).  Returns false and sets an explanation otherwise.
   */
  bool IsValid (std::string& reason) const;

  friend bool
  operator== (const CurveType& a, const CurveType& b)
  {
    return a.kind == b.kind && a.coefficient == b.coefficient
            && a.scale == b.scale;
  }

};

/**
 * A pricing curve, i.e. a CurveType bound to the decimal places of the
 * involved tokens.  It maps between the supply (in raw supply-token units),
 * the reserve backing it (in raw reserve-token units) and the spot price.
 *
 * All computations are done with exact integer arithmetic.  The functions
 * are monotonically non-decreasing.  Supply() is the inverse of Reserve()
 * in the sense that it returns the largest supply whose reserve does not
 * exceed the given value.
 */
class Curve
{

private:

  /** The curve type and parameter.  */
  CurveType type;

  /** Decimal places of the tokens.  */
  DecimalPlaces normalize;

public:

  /**
   * Constructs the curve.  Fails with a curve-domain error if the
   * parameters of the type are not valid.
   */
  explicit Curve (const CurveType& t, const DecimalPlaces& d);

  Curve (const Curve&) = default;
  Curve& operator= (const Curve&) = default;

  const CurveType&
  GetType () const
  {
    return type;
  }

  const DecimalPlaces&
  GetDecimals () const
  {
    return normalize;
  }

  /**
   * Returns the instantaneous price (reserve tokens per supply token, both
   * in whole-token units) at the given supply.
   */
  Decimal SpotPrice (const Amount& supply) const;

  /**
   * Returns the reserve (in raw units) required to back the given supply,
   * i.e. the integral of the price from zero to the supply, rounded down.
   */
  Amount Reserve (const Amount& supply) const;

  /**
   * Returns the largest supply that is backed by the given reserve.
   */
  Amount Supply (const Amount& reserve) const;

};

/**
 * Computes the integer cube root (rounded down) of a non-negative number.
 */
BigInt IntegerCubeRoot (const BigInt& n);

} // namespace abc

#endif // ABC_CURVES_HPP
