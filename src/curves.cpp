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

#include "curves.hpp"

#include "errors.hpp"

#include <boost/multiprecision/integer.hpp>

#include <glog/logging.h>

#include <sstream>

namespace abc
{

constexpr unsigned CurveType::MAX_SCALE;

std::string
CurveKindToString (const CurveKind kind)
{
  switch (kind)
    {
    case CurveKind::CONSTANT:
      return "constant";
    case CurveKind::LINEAR:
      return "linear";
    case CurveKind::SQUARE_ROOT:
      return "square_root";
    }

  LOG (FATAL) << "Invalid curve kind: " << static_cast<int> (kind);
}

bool
CurveType::IsValid (std::string& reason) const
{
  if (coefficient == 0)
    {
      reason = "curve coefficient must not be zero";
      return false;
    }

  if (scale > MAX_SCALE)
    {
      std::ostringstream msg;
      msg << "curve scale " << scale << " exceeds the maximum of " << MAX_SCALE;
      reason = msg.str ();
      return false;
    }

  return true;
}

BigInt
IntegerCubeRoot (const BigInt& n)
{
  CHECK (n >= 0) << "Cube root of negative number " << n;
  if (n < 8)
    return n == 0 ? 0 : 1;

  /* Newton iteration starting from a power of two that is guaranteed to be
     at least the cube root.  The sequence then decreases monotonically until
     it reaches the floor of the root.  */
  const unsigned bits = boost::multiprecision::msb (n) + 1;
  BigInt x = BigInt (1) << ((bits + 2) / 3);
  while (true)
    {
      const BigInt sq = x * x;
      const BigInt y = (2 * x + n / sq) / 3;
      if (y >= x)
        break;
      x = y;
    }

  CHECK (x * x * x <= n);
  CHECK ((x + 1) * (x + 1) * (x + 1) > n);

  return x;
}

namespace
{

/**
 * Integer square root (rounded down) of a non-negative number.
 */
BigInt
IntegerSqrt (const BigInt& n)
{
  CHECK (n >= 0);
  return boost::multiprecision::sqrt (n);
}

/**
 * Converts the result of a curve evaluation back into an Amount, failing
 * with an overflow error if it does not fit.
 */
Amount
ToAmountOrFail (const BigInt& val, const std::string& what)
{
  Amount res;
  if (!BigToAmount (val, res))
    {
      std::ostringstream msg;
      msg << "Computed " << what << " " << val
          << " exceeds the representable amount range";
      ReturnError (ErrorCode::ARITHMETIC_OVERFLOW, msg.str ());
    }

  return res;
}

/**
 * The numeric parameters of a curve evaluation:  The coefficient, 10^scale
 * and the units (10^decimals) of the two tokens.
 */
struct Params
{
  BigInt k;
  BigInt scale;
  BigInt supplyUnit;
  BigInt reserveUnit;
};

/* The reserve functions operate in the fixed-point domain.  They take the
   supply as fixed-point value and return the reserve as fixed-point
   value.  */

BigInt
ConstantReserve (const Params& p, const BigInt& s)
{
  return p.k * s / p.scale;
}

BigInt
LinearReserve (const Params& p, const BigInt& s)
{
  return p.k * s * s / (2 * p.scale * Decimal::One ());
}

BigInt
SquareRootReserve (const Params& p, const BigInt& s)
{
  const BigInt num = 4 * p.k * p.k * s * s * s;
  const BigInt denom = 9 * p.scale * p.scale * Decimal::One ();
  return IntegerSqrt (num / denom);
}

/* The supply functions compute the largest raw supply S for which the
   raw reserve is at most R.  They work on raw amounts directly, since
   that way the maximum is exact.  The reserve in raw units is
   floor (f(S)), so the condition is f(S) < R + 1.  */

BigInt
ConstantSupply (const Params& p, const BigInt& r)
{
  /* k S Ur / (E Us) < R + 1  */
  const BigInt num = (r + 1) * p.scale * p.supplyUnit - 1;
  return num / (p.k * p.reserveUnit);
}

BigInt
LinearSupply (const Params& p, const BigInt& r)
{
  /* k S^2 Ur / (2 E Us^2) < R + 1  */
  const BigInt num
      = (r + 1) * 2 * p.scale * p.supplyUnit * p.supplyUnit - 1;
  return IntegerSqrt (num / (p.k * p.reserveUnit));
}

BigInt
SquareRootSupply (const Params& p, const BigInt& r)
{
  /* 4 k^2 S^3 Ur^2 / (9 E^2 Us^3) < (R + 1)^2  */
  const BigInt num = (r + 1) * (r + 1) * 9 * p.scale * p.scale
                        * p.supplyUnit * p.supplyUnit * p.supplyUnit
                      - 1;
  const BigInt denom = 4 * p.k * p.k * p.reserveUnit * p.reserveUnit;
  return IntegerCubeRoot (num / denom);
}

Amount
SupplyOrFail (const BigInt& s, const Amount& reserve, const CurveKind kind)
{
  VLOG (2)
      << "Supply for reserve " << reserve << " on "
      << CurveKindToString (kind) << " curve: " << s;

  return ToAmountOrFail (s, "supply");
}

} // anonymous namespace

Curve::Curve (const CurveType& t, const DecimalPlaces& d)
  : type(t), normalize(d)
{
  std::string reason;
  if (!type.IsValid (reason))
    ReturnError (ErrorCode::CURVE_DOMAIN, reason);
}

namespace
{

Params
GetParams (const CurveType& type, const DecimalPlaces& normalize)
{
  Params res;
  res.k = BigInt (type.GetCoefficient ());
  res.scale = Pow10 (type.GetScale ());
  res.supplyUnit = normalize.SupplyUnit ();
  res.reserveUnit = normalize.ReserveUnit ();
  return res;
}

/**
 * Converts the atomics of a spot price to a Decimal, failing with
 * an overflow error if they are out of range.
 */
Decimal
PriceOrFail (const BigInt& atomics, const Amount& supply)
{
  Decimal res;
  if (!Decimal::FromBigAtomics (atomics, res))
    {
      std::ostringstream msg;
      msg << "Spot price at supply " << supply << " is out of range";
      ReturnError (ErrorCode::ARITHMETIC_OVERFLOW, msg.str ());
    }

  return res;
}

} // anonymous namespace

Decimal
Curve::SpotPrice (const Amount& supply) const
{
  const Params p = GetParams (type, normalize);
  const BigInt s = normalize.FromSupply (supply);

  switch (type.GetKind ())
    {
    case CurveKind::CONSTANT:
      return PriceOrFail (p.k * Decimal::One () / p.scale, supply);
    case CurveKind::LINEAR:
      return PriceOrFail (p.k * s / p.scale, supply);
    case CurveKind::SQUARE_ROOT:
      return PriceOrFail (IntegerSqrt (p.k * p.k * s * Decimal::One ()
                                        / (p.scale * p.scale)),
                          supply);
    }

  LOG (FATAL) << "Invalid curve kind: " << static_cast<int> (type.GetKind ());
}

Amount
Curve::Reserve (const Amount& supply) const
{
  const Params p = GetParams (type, normalize);
  const BigInt s = normalize.FromSupply (supply);

  switch (type.GetKind ())
    {
    case CurveKind::CONSTANT:
      return normalize.ToReserve (ConstantReserve (p, s));
    case CurveKind::LINEAR:
      return normalize.ToReserve (LinearReserve (p, s));
    case CurveKind::SQUARE_ROOT:
      return normalize.ToReserve (SquareRootReserve (p, s));
    }

  LOG (FATAL) << "Invalid curve kind: " << static_cast<int> (type.GetKind ());
}

Amount
Curve::Supply (const Amount& reserve) const
{
  const Params p = GetParams (type, normalize);
  const BigInt r(reserve);

  switch (type.GetKind ())
    {
    case CurveKind::CONSTANT:
      return SupplyOrFail (ConstantSupply (p, r), reserve, type.GetKind ());
    case CurveKind::LINEAR:
      return SupplyOrFail (LinearSupply (p, r), reserve, type.GetKind ());
    case CurveKind::SQUARE_ROOT:
      return SupplyOrFail (SquareRootSupply (p, r), reserve, type.GetKind ());
    }

  LOG (FATAL) << "Invalid curve kind: " << static_cast<int> (type.GetKind ());
}

} // namespace abc
