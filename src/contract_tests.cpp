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

#include "contract.hpp"

#include "testutils.hpp"

#include "database/dbtest.hpp"
#include "database/slots.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace abc
{
namespace
{

using testing::ElementsAre;

constexpr const char ADDRESS[] = "contract";
constexpr const char SUPPLY[] = "factory/contract/epoxy";
constexpr const char RESERVE[] = "satoshi";

/** Linear curve with slope 0.1 and an initial raise of (1, 100).  */
const std::string LINEAR_SALE = R"(
  supply:
    {
      subdenom: "epoxy"
      decimals: 2
      metadata: { name: "Epoxy" symbol: "EPX" }
    }
  reserve: { denom: "satoshi" decimals: 8 }
  curve_type: { linear: { slope: "1" scale: 1 } }
  phase_config:
    {
      hatch:
        {
          initial_raise: { min: "1" max: "100" }
          initial_price: "1"
          initial_allocation: 10
          reserve_percentage: 10
        }
    }
)";

class ContractTests : public DBTestWithSchema
{

protected:

  Contract contract;

  ContractTests ()
    : contract(db, ADDRESS)
  {}

  /**
   * Instantiates the contract from the given text-format message.
   */
  Response
  Instantiate (const std::string& text)
  {
    return contract.Instantiate ("creator", {},
                                 ParseTextProto<proto::InstantiateMsg> (text));
  }

  Response
  Buy (const std::string& buyer, const Amount& payment)
  {
    return contract.Buy (buyer, {Coin (RESERVE, payment)});
  }

  Response
  Burn (const std::string& seller, const Amount& amount)
  {
    return contract.Burn (seller, {Coin (SUPPLY, amount)}, amount);
  }

  void
  ExpectCurveInfo (const Amount& reserve, const Amount& supply,
                   const std::string& price)
  {
    const auto info = contract.QueryCurveInfo ();
    EXPECT_EQ (info.reserve, reserve);
    EXPECT_EQ (info.supply, supply);
    EXPECT_EQ (info.spotPrice.ToString (), price);
    EXPECT_EQ (info.reserveDenom, RESERVE);
  }

};

TEST_F (ContractTests, NotInstantiated)
{
  EXPECT_FALSE (contract.IsInstantiated ());

  ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      contract.QueryCurveInfo ();
    });
  ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      Buy ("alice", 100);
    });
}

TEST_F (ContractTests, Instantiate)
{
  const auto res = Instantiate (LINEAR_SALE);
  EXPECT_TRUE (contract.IsInstantiated ());

  ASSERT_EQ (res.GetMessages ().size (), 1);
  const auto& msg = res.GetMessages ()[0];
  EXPECT_EQ (msg.GetType (), Intent::Type::CREATE_DENOM);
  EXPECT_EQ (msg.GetDenom (), "epoxy");
  EXPECT_EQ (msg.GetMetadata ().name, "Epoxy");
  EXPECT_EQ (msg.GetMetadata ().symbol, "EPX");
  EXPECT_EQ (res.GetAttribute ("supply_denom"), SUPPLY);

  EXPECT_EQ (contract.QuerySupplyDenom (), SUPPLY);
  EXPECT_EQ (contract.QueryPhase (), CommonsPhase ());
  ExpectCurveInfo (0, 0, "0");

  const auto config = contract.QueryPhaseConfig ();
  EXPECT_EQ (config.hatch.raiseMin, 1);
  EXPECT_EQ (config.hatch.raiseMax, 100);
  EXPECT_FALSE (config.hatch.hasAllowlist);
}

TEST_F (ContractTests, InstantiateTwice)
{
  Instantiate (LINEAR_SALE);
  const auto msg = ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      Instantiate (LINEAR_SALE);
    });
  EXPECT_EQ (msg, "contract is already instantiated");
}

TEST_F (ContractTests, InstantiateIsNonpayable)
{
  ExpectSaleError (ErrorCode::PAYMENT, [this] ()
    {
      contract.Instantiate ("creator", {Coin (RESERVE, 1)},
                            ParseTextProto<proto::InstantiateMsg> (
                                LINEAR_SALE));
    });
  EXPECT_FALSE (contract.IsInstantiated ());
}

TEST_F (ContractTests, InvalidInstantiation)
{
  ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      Instantiate (R"(
        supply: { subdenom: "" decimals: 2 }
        reserve: { denom: "satoshi" decimals: 8 }
        curve_type: { constant: { value: "1" scale: 0 } }
        phase_config: { hatch: { initial_price: "1" } }
      )");
    });
  ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      Instantiate (R"(
        supply: { subdenom: "epoxy" decimals: 2 }
        reserve: { denom: "satoshi" decimals: 19 }
        curve_type: { constant: { value: "1" scale: 0 } }
        phase_config: { hatch: { initial_price: "1" } }
      )");
    });
  ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      Instantiate (R"(
        supply: { subdenom: "epoxy" decimals: 2 }
        reserve: { denom: "satoshi" decimals: 8 }
        curve_type: { constant: { value: "0" scale: 0 } }
        phase_config: { hatch: { initial_price: "1" } }
      )");
    });
  ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      Instantiate (R"(
        supply: { subdenom: "epoxy" decimals: 2 }
        reserve: { denom: "satoshi" decimals: 8 }
        curve_type: { constant: { value: "1" scale: 0 } }
        phase_config:
          {
            hatch:
              {
                initial_raise: { min: "10" max: "5" }
                initial_price: "1"
              }
          }
      )");
    });

  EXPECT_FALSE (contract.IsInstantiated ());
}

TEST_F (ContractTests, InstantiateFromText)
{
  const auto res = InstantiateFromText (contract, LINEAR_SALE);
  EXPECT_TRUE (contract.IsInstantiated ());
  EXPECT_EQ (res.GetAttribute ("supply_denom"), SUPPLY);
  EXPECT_EQ (contract.QueryPhase (), CommonsPhase ());
  ExpectCurveInfo (0, 0, "0");

  Buy ("alice", 500'000'000);
  ExpectCurveInfo (500'000'000, 1'000, "1");
}

TEST_F (ContractTests, InstantiateFromUnparseableText)
{
  for (const std::string text : {"supply: {", "foo: 42",
                                 R"(curve_type: { linear: { scale: "x" } })"})
    ExpectSaleError (ErrorCode::CONFIG, [this, &text] ()
      {
        InstantiateFromText (contract, text);
      });

  EXPECT_FALSE (contract.IsInstantiated ());
}

TEST_F (ContractTests, InstantiateFromTextValidates)
{
  ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      InstantiateFromText (contract, R"(
        supply: { subdenom: "epoxy" decimals: 2 }
        reserve: { denom: "satoshi" decimals: 8 }
        curve_type: { constant: { value: "0" scale: 0 } }
        phase_config: { hatch: { initial_price: "1" } }
      )");
    });

  EXPECT_FALSE (contract.IsInstantiated ());
}

TEST_F (ContractTests, LinearScenario)
{
  Instantiate (LINEAR_SALE);

  auto res = Buy ("alice", 500'000'000);
  ASSERT_EQ (res.GetMessages ().size (), 1);
  EXPECT_EQ (res.GetMessages ()[0].GetType (), Intent::Type::MINT);
  EXPECT_EQ (res.GetMessages ()[0].GetAmount (), 1'000);
  EXPECT_EQ (res.GetMessages ()[0].GetDenom (), SUPPLY);
  EXPECT_EQ (res.GetAttribute ("phase"), "open");
  ExpectCurveInfo (500'000'000, 1'000, "1");
  EXPECT_EQ (contract.QueryPhase ().GetKind (), PhaseKind::OPEN);

  res = Buy ("bob", 1'500'000'000);
  EXPECT_EQ (res.GetMessages ()[0].GetAmount (), 1'000);
  ExpectCurveInfo (2'000'000'000, 2'000, "2");

  res = Burn ("bob", 1'000);
  ASSERT_EQ (res.GetMessages ().size (), 2);
  EXPECT_EQ (res.GetMessages ()[0].GetType (), Intent::Type::TRANSFER);
  EXPECT_EQ (res.GetMessages ()[0].GetAmount (), 1'500'000'000);
  EXPECT_EQ (res.GetMessages ()[0].GetAddress (), "bob");
  EXPECT_EQ (res.GetMessages ()[1].GetType (), Intent::Type::BURN);
  EXPECT_EQ (res.GetMessages ()[1].GetAmount (), 1'000);
  ExpectCurveInfo (500'000'000, 1'000, "1");
}

TEST_F (ContractTests, HatchersArePersisted)
{
  Instantiate (R"(
    supply: { subdenom: "epoxy" decimals: 2 }
    reserve: { denom: "satoshi" decimals: 8 }
    curve_type: { linear: { slope: "1" scale: 1 } }
    phase_config:
      {
        hatch:
          {
            initial_raise: { min: "1" max: "1000000000" }
            initial_price: "1"
          }
      }
  )");

  Buy ("alice", 10);
  Buy ("bob", 10);
  Buy ("alice", 10);

  const auto phase = contract.QueryPhase ();
  EXPECT_EQ (phase.GetKind (), PhaseKind::HATCH);
  EXPECT_THAT (phase.GetHatchers (), ElementsAre ("alice", "bob"));
}

TEST_F (ContractTests, AllowlistEnforced)
{
  Instantiate (R"(
    supply: { subdenom: "epoxy" decimals: 2 }
    reserve: { denom: "satoshi" decimals: 8 }
    curve_type: { linear: { slope: "1" scale: 1 } }
    phase_config:
      {
        hatch:
          {
            allowlist: { addresses: "alice" }
            initial_raise: { min: "1" max: "1000000000" }
            initial_price: "1"
          }
      }
  )");

  Buy ("alice", 500);
  ExpectCurveInfo (500, 1, "0.001");

  ExpectSaleError (ErrorCode::ALLOWLIST, [this] ()
    {
      Buy ("bob", 500);
    });
  ExpectCurveInfo (500, 1, "0.001");
  EXPECT_THAT (contract.QueryPhase ().GetHatchers (), ElementsAre ("alice"));
}

TEST_F (ContractTests, FailedOperationIsRolledBack)
{
  Instantiate (LINEAR_SALE);
  Buy ("alice", 500'000'000);

  ExpectSaleError (ErrorCode::PAYMENT, [this] ()
    {
      contract.Burn ("alice", {Coin (SUPPLY, 10)}, 20);
    });
  ExpectSaleError (ErrorCode::ARITHMETIC_OVERFLOW, [this] ()
    {
      Buy ("alice", MAX_AMOUNT);
    });

  ExpectCurveInfo (500'000'000, 1'000, "1");

  /* Operations keep working after the rollbacks.  */
  Burn ("alice", 1'000);
  ExpectCurveInfo (0, 0, "0");
}

TEST_F (ContractTests, SquareRootSmallFirstBuy)
{
  Instantiate (R"(
    supply: { subdenom: "epoxy" decimals: 2 }
    reserve: { denom: "satoshi" decimals: 8 }
    curve_type: { square_root: { slope: "1" scale: 1 } }
    phase_config:
      {
        hatch:
          {
            initial_raise: { min: "1" max: "100" }
            initial_price: "1"
          }
      }
  )");

  Buy ("alice", 1);

  const Curve curve(CurveType::SquareRoot (1, 1), DecimalPlaces (2, 8));
  const auto info = contract.QueryCurveInfo ();
  EXPECT_EQ (info.reserve, 1);
  EXPECT_EQ (info.supply, curve.Supply (1));
  EXPECT_EQ (info.spotPrice, curve.SpotPrice (info.supply));
}

TEST_F (ContractTests, CorruptStoreIsReported)
{
  Instantiate (LINEAR_SALE);

  proto::CurveState state;
  state.set_reserve ("not a number");
  StateSlots slots(db);
  slots.Set (Slot::CURVE_STATE, state);

  ExpectSaleError (ErrorCode::CONFIG, [this] ()
    {
      contract.QueryCurveInfo ();
    });
}

} // anonymous namespace
} // namespace abc
