// NOLINTBEGIN

#include <gtest/gtest.h>

#include <kvgas/gas/basic_gas_meter.hpp>
#include <kvgas/gas/gas_meter.hpp>
#include <kvgas/gas/infinite_gas_meter.hpp>

#include <limits>
#include <type_traits>
#include <vector>

using namespace std::string_view_literals;

constexpr auto max_gas = std::numeric_limits< kvgas::gas::gas >::max();

static_assert( !std::is_convertible_v< kvgas::gas::gas, kvgas::gas::basic_gas_meter > );

TEST( gas_meter, consume_under_limit )
{
  std::vector< kvgas::gas::gas > charges{ 1, 2, 3, 10, 984 };

  auto meter = kvgas::gas::make_gas_meter( 1'000 );
  EXPECT_EQ( meter->limit(), 1'000 );
  EXPECT_EQ( meter->gas_consumed(), 0 );

  kvgas::gas::gas sum = 0;
  for( auto charge: charges )
  {
    sum += charge;
    EXPECT_TRUE( meter->consume_gas( charge, "unit test"sv ) );
    EXPECT_EQ( meter->gas_consumed(), sum );
    EXPECT_EQ( meter->gas_consumed_to_limit(), sum );
  }

  EXPECT_EQ( meter->gas_consumed(), 1'000 );
  EXPECT_TRUE( meter->is_out_of_gas() );
  EXPECT_FALSE( meter->is_past_limit() );
  EXPECT_FALSE( meter->report() );

  EXPECT_TRUE( meter->refund_gas( 400, "refund"sv ) );
  EXPECT_EQ( meter->gas_consumed(), 600 );
  EXPECT_FALSE( meter->is_out_of_gas() );
  EXPECT_FALSE( meter->report() );
}

TEST( gas_meter, out_of_gas )
{
  kvgas::gas::basic_gas_meter meter( 100 );

  EXPECT_TRUE( meter.consume_gas( 90, "first"sv ) );
  EXPECT_FALSE( meter.is_out_of_gas() );

  auto result = meter.consume_gas( 20, "second"sv );
  if( result )
    ADD_FAILURE() << "charge past the limit erroneously succeeded";
  else
  {
    EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::out_of_gas );
    EXPECT_EQ( result.error().code(), kvgas::gas::gas_errc::out_of_gas );
    EXPECT_EQ( result.error().descriptor(), "second" );
  }

  EXPECT_EQ( meter.gas_consumed(), 110 );
  EXPECT_EQ( meter.gas_consumed_to_limit(), 100 );
  EXPECT_TRUE( meter.is_past_limit() );
  EXPECT_TRUE( meter.is_out_of_gas() );
}

TEST( gas_meter, zero_limit )
{
  kvgas::gas::basic_gas_meter meter( 0 );

  EXPECT_TRUE( meter.is_out_of_gas() );
  EXPECT_FALSE( meter.is_past_limit() );

  EXPECT_TRUE( meter.consume_gas( 0, "free"sv ) );

  auto result = meter.consume_gas( 1, "paid"sv );
  ASSERT_FALSE( result );
  EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::out_of_gas );
  EXPECT_EQ( meter.gas_consumed(), 1 );
  EXPECT_EQ( meter.gas_consumed_to_limit(), 0 );
}

TEST( gas_meter, limit_boundary )
{
  kvgas::gas::basic_gas_meter meter( 50 );

  EXPECT_TRUE( meter.consume_gas( 50, "exact"sv ) );
  EXPECT_EQ( meter.gas_consumed(), 50 );
  EXPECT_TRUE( meter.is_out_of_gas() );
  EXPECT_FALSE( meter.is_past_limit() );
  EXPECT_EQ( meter.gas_consumed_to_limit(), 50 );
}

TEST( gas_meter, overflow )
{
  kvgas::gas::basic_gas_meter meter( max_gas );

  EXPECT_TRUE( meter.consume_gas( max_gas - 1, "almost"sv ) );
  EXPECT_EQ( meter.gas_consumed(), max_gas - 1 );

  auto result = meter.consume_gas( 5, "overflow"sv );
  if( result )
    ADD_FAILURE() << "overflowing charge erroneously succeeded";
  else
  {
    EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::gas_overflow );
    EXPECT_EQ( result.error().descriptor(), "overflow" );
  }

  EXPECT_EQ( meter.gas_consumed(), max_gas );
  EXPECT_FALSE( meter.is_past_limit() );
  EXPECT_TRUE( meter.is_out_of_gas() );
}

TEST( gas_meter, overflow_below_limit )
{
  kvgas::gas::basic_gas_meter meter( 10 );

  auto result = meter.consume_gas( max_gas, "huge"sv );
  ASSERT_FALSE( result );
  EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::out_of_gas );

  result = meter.consume_gas( 1, "more"sv );
  ASSERT_FALSE( result );
  EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::gas_overflow );
  EXPECT_EQ( meter.gas_consumed(), max_gas );
  EXPECT_EQ( meter.gas_consumed_to_limit(), 10 );
}

TEST( gas_meter, negative_gas_consumed )
{
  kvgas::gas::basic_gas_meter meter( 100 );

  EXPECT_TRUE( meter.consume_gas( 10, "charge"sv ) );

  auto result = meter.refund_gas( 11, "refund"sv );
  if( result )
    ADD_FAILURE() << "refund past zero erroneously succeeded";
  else
  {
    EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::negative_gas_consumed );
    EXPECT_EQ( result.error().descriptor(), "refund" );
  }

  EXPECT_EQ( meter.gas_consumed(), 10 );

  EXPECT_TRUE( meter.refund_gas( 10, "refund"sv ) );
  EXPECT_EQ( meter.gas_consumed(), 0 );
  EXPECT_FALSE( meter.report() );
}

TEST( gas_meter, report )
{
  kvgas::gas::basic_gas_meter meter( 1'000, true );
  ASSERT_TRUE( meter.report() );
  EXPECT_TRUE( meter.report()->empty() );

  EXPECT_TRUE( meter.consume_gas( 10, "ReadFlat"sv ) );
  EXPECT_TRUE( meter.consume_gas( 5, "ReadFlat"sv ) );
  EXPECT_EQ( meter.report()->at( "ReadFlat" ), 15 );
  EXPECT_EQ( meter.report()->size(), 1 );

  EXPECT_TRUE( meter.consume_gas( 7, "WriteFlat"sv ) );
  EXPECT_EQ( meter.report()->at( "ReadFlat" ), 15 );
  EXPECT_EQ( meter.report()->at( "WriteFlat" ), 7 );
  EXPECT_EQ( meter.report()->size(), 2 );

  EXPECT_TRUE( meter.refund_gas( 4, "ReadFlat"sv ) );
  EXPECT_EQ( meter.report()->at( "ReadFlat" ), 11 );
  EXPECT_EQ( meter.gas_consumed(), 18 );
}

TEST( gas_meter, report_skips_failed_charge )
{
  kvgas::gas::basic_gas_meter meter( 100, true );

  EXPECT_TRUE( meter.consume_gas( 60, "ReadFlat"sv ) );
  EXPECT_FALSE( meter.consume_gas( 60, "ReadFlat"sv ) );
  EXPECT_FALSE( meter.consume_gas( 1, "WriteFlat"sv ) );

  EXPECT_EQ( meter.gas_consumed(), 121 );
  EXPECT_EQ( meter.report()->at( "ReadFlat" ), 60 );
  EXPECT_FALSE( meter.report()->contains( "WriteFlat" ) );
}

TEST( gas_meter, report_skips_overflowing_charge )
{
  kvgas::gas::basic_gas_meter meter( max_gas, true );

  EXPECT_TRUE( meter.consume_gas( 10, "ReadFlat"sv ) );

  if( auto result = meter.consume_gas( max_gas, "ReadFlat"sv ); result )
    ADD_FAILURE() << "expected gas_overflow";
  else
    EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::gas_overflow );

  EXPECT_FALSE( meter.consume_gas( 1, "WriteFlat"sv ) );

  EXPECT_EQ( meter.gas_consumed(), max_gas );
  EXPECT_EQ( meter.report()->at( "ReadFlat" ), 10 );
  EXPECT_FALSE( meter.report()->contains( "WriteFlat" ) );
}

TEST( gas_meter, report_refund_saturates )
{
  kvgas::gas::basic_gas_meter meter( 100, true );

  EXPECT_TRUE( meter.consume_gas( 30, "ReadFlat"sv ) );
  EXPECT_TRUE( meter.consume_gas( 5, "WriteFlat"sv ) );

  EXPECT_TRUE( meter.refund_gas( 20, "WriteFlat"sv ) );
  EXPECT_EQ( meter.gas_consumed(), 15 );
  EXPECT_EQ( meter.report()->at( "WriteFlat" ), 0 );
  EXPECT_EQ( meter.report()->at( "ReadFlat" ), 30 );

  EXPECT_TRUE( meter.refund_gas( 10, "Has"sv ) );
  EXPECT_EQ( meter.gas_consumed(), 5 );
  EXPECT_EQ( meter.report()->at( "Has" ), 0 );

  EXPECT_FALSE( meter.refund_gas( 6, "Has"sv ) );
  EXPECT_EQ( meter.gas_consumed(), 5 );
}

TEST( gas_meter, report_disabled )
{
  auto meter = kvgas::gas::make_gas_meter( 100, false );

  EXPECT_TRUE( meter->consume_gas( 10, "ReadFlat"sv ) );
  EXPECT_TRUE( meter->refund_gas( 3, "ReadFlat"sv ) );
  EXPECT_FALSE( meter->consume_gas( 100, "WriteFlat"sv ) );

  EXPECT_FALSE( meter->report() );
}

TEST( gas_meter, to_string )
{
  kvgas::gas::basic_gas_meter meter( 100 );
  EXPECT_TRUE( meter.consume_gas( 42, "unit test"sv ) );

  EXPECT_EQ( meter.to_string(), "BasicGasMeter:\n  limit: 100\n  consumed: 42" );
}

TEST( infinite_gas_meter, consume )
{
  auto meter = kvgas::gas::make_infinite_gas_meter();

  EXPECT_EQ( meter->limit(), 0 );
  EXPECT_FALSE( meter->is_out_of_gas() );
  EXPECT_FALSE( meter->is_past_limit() );

  EXPECT_TRUE( meter->consume_gas( max_gas / 2, "half"sv ) );
  EXPECT_TRUE( meter->consume_gas( max_gas / 2, "half"sv ) );
  EXPECT_EQ( meter->gas_consumed(), max_gas - 1 );
  EXPECT_EQ( meter->gas_consumed_to_limit(), max_gas - 1 );
  EXPECT_EQ( meter->limit(), 0 );
  EXPECT_FALSE( meter->is_out_of_gas() );
  EXPECT_FALSE( meter->is_past_limit() );
  EXPECT_FALSE( meter->report() );

  EXPECT_TRUE( meter->refund_gas( max_gas - 1, "refund"sv ) );
  EXPECT_EQ( meter->gas_consumed(), 0 );
}

TEST( infinite_gas_meter, overflow )
{
  kvgas::gas::infinite_gas_meter meter;

  EXPECT_TRUE( meter.consume_gas( max_gas - 1, "almost"sv ) );

  auto result = meter.consume_gas( 5, "overflow"sv );
  if( result )
    ADD_FAILURE() << "overflowing charge erroneously succeeded";
  else
  {
    EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::gas_overflow );
    EXPECT_EQ( result.error().descriptor(), "overflow" );
  }

  EXPECT_EQ( meter.gas_consumed(), max_gas );
  EXPECT_FALSE( meter.is_out_of_gas() );
  EXPECT_FALSE( meter.is_past_limit() );
}

TEST( infinite_gas_meter, negative_gas_consumed )
{
  kvgas::gas::infinite_gas_meter meter;

  auto result = meter.refund_gas( 1, "refund"sv );
  ASSERT_FALSE( result );
  EXPECT_EQ( result.error().value(), kvgas::gas::gas_errc::negative_gas_consumed );
  EXPECT_EQ( meter.gas_consumed(), 0 );

  EXPECT_TRUE( meter.consume_gas( 3, "charge"sv ) );
  EXPECT_TRUE( meter.refund_gas( 3, "refund"sv ) );
  EXPECT_EQ( meter.gas_consumed(), 0 );
  EXPECT_FALSE( meter.report() );
}

TEST( infinite_gas_meter, to_string )
{
  kvgas::gas::infinite_gas_meter meter;
  EXPECT_TRUE( meter.consume_gas( 7, "unit test"sv ) );

  EXPECT_EQ( meter.to_string(), "InfiniteGasMeter:\n  consumed: 7" );
}

// NOLINTEND
