// NOLINTBEGIN

#include <stdexcept>

#include <gtest/gtest.h>

#include <objectum/encode.hpp>
#include <objectum/log.hpp>
#include <test/fixture.hpp>

using namespace objectum;
using protocol::change_kind;

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "integration", "debug" ),
      alice( protocol::make_address( 0xa1 ) ),
      bob( protocol::make_address( 0xb0 ) )
  {
    gas = add_gas( alice );
  }

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  std::uint64_t balance( const protocol::object_id& id ) const
  {
    return execution::coin_balance( latest( id ) ).value();
  }

  protocol::address alice;
  protocol::address bob;
  protocol::object gas;
};

TEST_F( integration, transfer )
{
  auto obj = add_object( protocol::address_owner{ alice } );

  protocol::transaction_builder builder;
  builder.transfer_objects( { builder.owned_object( obj.ref() ) }, builder.pure( bob ) );
  auto tx = make_transaction( builder, alice, gas.id );

  execution::script s;
  s.writes.push_back( { .id = obj.id, .owner = protocol::address_owner{ bob } } );

  auto effects = process( tx, s );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  EXPECT_EQ( effects->transaction, protocol::make_id( tx ) );
  EXPECT_EQ( effects->lamport_version, 2 );
  EXPECT_EQ( effects->classification_of( obj.id ), change_kind::mutated );
  EXPECT_EQ( effects->modified_at( obj.id ), 1 );
  EXPECT_EQ( effects->gas_used.computation_cost, 10 );

  auto updated = latest( obj.id );
  EXPECT_EQ( updated.version, 2 );
  EXPECT_EQ( updated.owner, protocol::owner{ protocol::address_owner{ bob } } );
  EXPECT_EQ( updated.previous_transaction, effects->transaction );
  EXPECT_EQ( updated.contents, obj.contents );

  EXPECT_EQ( latest( gas.id ).version, 2 );
  EXPECT_EQ( balance( gas.id ), 1'000'000 - 10 );
  EXPECT_EQ( effects->gas_object.first, latest_ref( gas.id ) );

  auto stored = _store->get_effects( effects->transaction );
  ASSERT_TRUE( stored.has_value() );
  EXPECT_EQ( stored->digest(), effects->digest() );
}

TEST_F( integration, versions_only_move_forward )
{
  auto obj   = add_object( protocol::address_owner{ alice } );
  auto other = add_object( protocol::address_owner{ alice } );

  protocol::sequence_number last = obj.version;

  for( int i = 0; i < 3; ++i )
  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "touch", { builder.owned_object( latest_ref( obj.id ) ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    auto effects = process( tx, { .writes = { { .id = obj.id } } } );
    ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

    EXPECT_GT( latest( obj.id ).version, last );
    EXPECT_EQ( latest( obj.id ).version, effects->lamport_version );
    last = latest( obj.id ).version;
  }

  EXPECT_EQ( last, 4 );

  // Joining an older object into the transaction lifts it to the shared Lamport version
  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ),
                     "things",
                     "join",
                     { builder.owned_object( latest_ref( obj.id ) ), builder.owned_object( other.ref() ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx, { .writes = { { .id = obj.id }, { .id = other.id } } } );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  EXPECT_EQ( effects->lamport_version, 5 );
  EXPECT_EQ( latest( obj.id ).version, 5 );
  EXPECT_EQ( latest( other.id ).version, 5 );
  EXPECT_EQ( effects->modified_at( other.id ), 1 );
  EXPECT_EQ( effects->modified_at( obj.id ), 4 );

  auto history = _store->get( obj.id, 3 );
  ASSERT_TRUE( history.has_value() );
  EXPECT_EQ( history->version, 3 );
}

TEST_F( integration, wrap_and_unwrap )
{
  auto container = add_object( protocol::address_owner{ alice } );
  auto child     = add_object( protocol::address_owner{ alice } );

  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ),
                       "things",
                       "wrap",
                       { builder.owned_object( container.ref() ), builder.owned_object( child.ref() ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    execution::script s;
    s.writes.push_back( { .id = container.id } );
    s.wraps.emplace_back( child.id, container.id );

    auto effects = process( tx, s );
    ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

    EXPECT_EQ( effects->classification_of( child.id ), change_kind::wrapped );
    auto ref = effects->ref_of( child.id );
    ASSERT_TRUE( ref.has_value() );
    EXPECT_EQ( ref->version, 2 );
    EXPECT_EQ( ref->digest, protocol::wrapped_digest );
  }

  EXPECT_FALSE( _store->get_latest( child.id ).has_value() );

  auto tomb = _store->get_tombstone( child.id );
  ASSERT_TRUE( tomb.has_value() );
  EXPECT_EQ( tomb->container, container.id );
  EXPECT_EQ( tomb->version, 2 );

  auto wrapped_ref = _store->get_latest_ref( child.id );
  ASSERT_TRUE( wrapped_ref.has_value() );
  EXPECT_TRUE( protocol::is_wrapped( wrapped_ref->digest ) );

  // A stale reference to the wrapped object is no longer a valid input
  {
    protocol::transaction_builder builder;
    builder.transfer_objects( { builder.owned_object( child.ref() ) }, builder.pure( bob ) );
    auto tx = make_transaction( builder, alice, gas.id );

    auto effects = process( tx );
    ASSERT_FALSE( effects.has_value() );
    EXPECT_EQ( effects.error(), protocol::user_input_errc::object_not_found );
  }

  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "unwrap", { builder.owned_object( latest_ref( container.id ) ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    execution::script s;
    s.writes.push_back( { .id = container.id } );
    s.writes.push_back( { .id       = child.id,
                          .owner    = protocol::address_owner{ alice },
                          .type     = child.type,
                          .contents = child.contents } );

    auto effects = process( tx, s );
    ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

    EXPECT_EQ( effects->lamport_version, 3 );
    EXPECT_EQ( effects->classification_of( child.id ), change_kind::unwrapped );
    EXPECT_FALSE( effects->modified_at( child.id ).has_value() );
  }

  auto unwrapped = latest( child.id );
  EXPECT_EQ( unwrapped.version, 3 );
  EXPECT_EQ( unwrapped.contents, child.contents );
  EXPECT_FALSE( _store->get_tombstone( child.id ).has_value() );
}

TEST_F( integration, deleting_a_container_deletes_its_wrapped_objects )
{
  auto container = add_object( protocol::address_owner{ alice } );
  auto child     = add_object( protocol::address_owner{ alice } );

  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ),
                       "things",
                       "wrap",
                       { builder.owned_object( container.ref() ), builder.owned_object( child.ref() ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    execution::script s;
    s.writes.push_back( { .id = container.id } );
    s.wraps.emplace_back( child.id, container.id );
    ASSERT_TRUE( verify( process( tx, s ), verification::processed | verification::succeeded ) );
  }

  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ), "things", "destroy", { builder.owned_object( latest_ref( container.id ) ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx, { .deletions = { container.id } } );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  EXPECT_EQ( effects->classification_of( container.id ), change_kind::deleted );
  EXPECT_EQ( effects->classification_of( child.id ), change_kind::unwrapped_then_deleted );
  EXPECT_EQ( effects->deleted.size(), 1 );
  EXPECT_EQ( effects->unwrapped_then_deleted.size(), 1 );
  EXPECT_FALSE( _store->get_tombstone( child.id ).has_value() );

  auto ref = _store->get_latest_ref( container.id );
  ASSERT_TRUE( ref.has_value() );
  EXPECT_TRUE( protocol::is_deleted( ref->digest ) );
  EXPECT_EQ( ref->version, effects->lamport_version );
}

TEST_F( integration, deletion_cascades_to_children )
{
  auto parent     = add_object( protocol::address_owner{ alice } );
  auto child      = add_object( protocol::object_owner{ parent.id } );
  auto grandchild = add_object( protocol::object_owner{ child.id } );

  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ), "things", "destroy", { builder.owned_object( parent.ref() ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx, { .deletions = { parent.id } } );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  EXPECT_EQ( effects->deleted.size(), 3 );
  for( const auto& id: { parent.id, child.id, grandchild.id } )
  {
    EXPECT_EQ( effects->classification_of( id ), change_kind::deleted );
    EXPECT_FALSE( _store->get_latest( id ).has_value() );
  }

  for( const auto& ref: effects->deleted )
  {
    EXPECT_EQ( ref.version, effects->lamport_version );
    EXPECT_EQ( ref.digest, protocol::deleted_digest );
  }
}

TEST_F( integration, deletion_cascades_through_child_inputs )
{
  auto parent     = add_object( protocol::address_owner{ alice } );
  auto child      = add_object( protocol::object_owner{ parent.id } );
  auto grandchild = add_object( protocol::object_owner{ child.id } );

  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ),
                     "things",
                     "destroy",
                     { builder.owned_object( parent.ref() ), builder.owned_object( child.ref() ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx, { .deletions = { parent.id } } );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  EXPECT_EQ( effects->deleted.size(), 3 );
  for( const auto& id: { parent.id, child.id, grandchild.id } )
  {
    EXPECT_EQ( effects->classification_of( id ), change_kind::deleted );
    EXPECT_FALSE( _store->get_latest( id ).has_value() );
  }

  EXPECT_EQ( effects->modified_at( grandchild.id ), 1 );
  EXPECT_TRUE( _store->children_of( child.id ).empty() );
}

TEST_F( integration, deletion_cascades_to_objects_wrapped_in_child_inputs )
{
  auto parent = add_object( protocol::address_owner{ alice } );
  auto child  = add_object( protocol::object_owner{ parent.id } );
  auto item   = add_object( protocol::address_owner{ alice } );

  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ),
                       "things",
                       "stash",
                       { builder.owned_object( parent.ref() ),
                         builder.owned_object( child.ref() ),
                         builder.owned_object( item.ref() ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    execution::script s;
    s.writes.push_back( { .id = child.id } );
    s.wraps.emplace_back( item.id, child.id );
    ASSERT_TRUE( verify( process( tx, s ), verification::processed | verification::succeeded ) );
  }

  ASSERT_TRUE( _store->get_tombstone( item.id ).has_value() );

  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ),
                     "things",
                     "destroy",
                     { builder.owned_object( latest_ref( parent.id ) ), builder.owned_object( latest_ref( child.id ) ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx, { .deletions = { parent.id } } );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  EXPECT_EQ( effects->classification_of( parent.id ), change_kind::deleted );
  EXPECT_EQ( effects->classification_of( child.id ), change_kind::deleted );
  EXPECT_EQ( effects->classification_of( item.id ), change_kind::unwrapped_then_deleted );
  EXPECT_EQ( effects->deleted.size(), 2 );
  EXPECT_EQ( effects->unwrapped_then_deleted.size(), 1 );

  EXPECT_FALSE( _store->get_tombstone( item.id ).has_value() );
  auto ref = _store->get_latest_ref( item.id );
  ASSERT_TRUE( ref.has_value() );
  EXPECT_TRUE( protocol::is_deleted( ref->digest ) );
}

TEST_F( integration, oversized_cascade_fails_the_transaction )
{
  test::fixture bounded( "cascade", "debug", { .max_cascade_size = 1 } );

  auto payer      = bounded.add_gas( alice );
  auto parent     = bounded.add_object( protocol::address_owner{ alice } );
  auto child      = bounded.add_object( protocol::object_owner{ parent.id } );
  auto grandchild = bounded.add_object( protocol::object_owner{ child.id } );

  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ), "things", "destroy", { builder.owned_object( parent.ref() ) } );
  auto tx = bounded.make_transaction( builder, alice, payer.id );

  auto effects = bounded.process( tx, { .deletions = { parent.id } } );
  ASSERT_TRUE( verify( effects, verification::processed ) );
  ASSERT_FALSE( effects->status.success() );
  EXPECT_EQ( effects->status.failure->error, protocol::execution_errc::cascade_limit_exceeded );

  EXPECT_EQ( bounded.latest( parent.id ).version, 2 );
  EXPECT_EQ( bounded.latest( child.id ).version, 1 );
  EXPECT_EQ( bounded.latest( grandchild.id ).version, 1 );
  EXPECT_EQ( execution::coin_balance( bounded.latest( payer.id ) ), 1'000'000 - 10 );
}

TEST_F( integration, taken_value )
{
  auto obj = add_object( protocol::address_owner{ alice } );

  protocol::transaction_builder builder;
  auto arg = builder.owned_object( obj.ref() );
  builder.make_move_vec( std::nullopt, { arg } );
  builder.move_call( protocol::make_address( 0xee ), "things", "touch", { arg } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx );
  ASSERT_TRUE( verify( effects, verification::processed ) );
  ASSERT_FALSE( effects->status.success() );

  const auto& failure = *effects->status.failure;
  EXPECT_EQ( failure.error, protocol::command_argument_errc::invalid_usage_of_taken_value );
  EXPECT_EQ( failure.command, 1 );
  EXPECT_EQ( failure.argument, 0 );

  // Gas is charged and the inputs are bumped even though nothing ran
  EXPECT_EQ( effects->gas_used.computation_cost, 20 );
  EXPECT_EQ( balance( gas.id ), 1'000'000 - 20 );
  EXPECT_EQ( latest( obj.id ).version, 2 );
  EXPECT_EQ( latest( obj.id ).contents, obj.contents );
}

TEST_F( integration, shared_object_in_vector )
{
  auto shared = add_object( protocol::shared{} );

  protocol::transaction_builder builder;
  builder.make_move_vec( std::nullopt, { builder.shared_object( shared.id, 1 ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx );
  ASSERT_TRUE( verify( effects, verification::processed ) );
  ASSERT_FALSE( effects->status.success() );

  const auto& failure = *effects->status.failure;
  EXPECT_EQ( failure.error, ownership::ownership_errc::shared_object_in_vector );
  EXPECT_EQ( failure.command, 0 );
  EXPECT_EQ( failure.argument, 0 );
}

TEST_F( integration, shared_objects )
{
  auto counter = add_object( protocol::shared{} );

  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "bump", { builder.shared_object( counter.id, 1 ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    auto effects = process( tx, { .writes = { { .id = counter.id, .contents = std::vector{ std::byte{ 0x02 } } } } } );
    ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );
    EXPECT_EQ( effects->classification_of( counter.id ), change_kind::mutated );
  }

  auto bumped = latest( counter.id );
  EXPECT_EQ( bumped.version, 2 );
  EXPECT_EQ( bumped.owner, protocol::owner{ protocol::shared{ 1 } } );

  // The initial shared version is part of the input and never changes
  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "bump", { builder.shared_object( counter.id, 2 ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    auto effects = process( tx );
    ASSERT_FALSE( effects.has_value() );
    EXPECT_EQ( effects.error(), protocol::user_input_errc::object_version_mismatch );
  }

  // Shared objects cannot be passed as owned inputs
  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "bump", { builder.owned_object( bumped.ref() ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    auto effects = process( tx );
    ASSERT_FALSE( effects.has_value() );
    EXPECT_EQ( effects.error(), protocol::user_input_errc::shared_object_not_owned_input );
  }

  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "take", { builder.shared_object( counter.id, 1 ) } );
    auto tx = make_transaction( builder, alice, gas.id );

    auto effects = process( tx, { .writes = { { .id = counter.id, .owner = protocol::address_owner{ alice } } } } );
    ASSERT_TRUE( verify( effects, verification::processed ) );
    ASSERT_FALSE( effects->status.success() );
    EXPECT_EQ( effects->status.failure->error, ownership::ownership_errc::shared_object_unshared );
  }

  EXPECT_EQ( latest( counter.id ).owner, protocol::owner{ protocol::shared{ 1 } } );
  EXPECT_EQ( latest( counter.id ).contents, std::vector{ std::byte{ 0x02 } } );
}

TEST_F( integration, shared_objects_read_by_immutable_reference )
{
  auto counter = add_object( protocol::shared{} );

  auto peek = [ & ]()
  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "peek", { builder.shared_object( counter.id, 1, false ) } );
    return make_transaction( builder, alice, gas.id );
  };

  // Read only, the shared object keeps its version
  {
    auto tx = peek();

    auto effects = process( tx, { .computation_units = 1 } );
    ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );
    EXPECT_FALSE( effects->classification_of( counter.id ).has_value() );
    EXPECT_EQ( latest( counter.id ).version, 1 );
  }

  // Writing it anyway fails the transaction and leaves it untouched
  {
    auto tx = peek();

    auto effects = process( tx, { .writes = { { .id = counter.id, .contents = std::vector{ std::byte{ 0x09 } } } } } );
    ASSERT_TRUE( verify( effects, verification::processed ) );
    ASSERT_FALSE( effects->status.success() );
    EXPECT_EQ( effects->status.failure->error, ownership::ownership_errc::read_only_input_mutation );
    EXPECT_FALSE( effects->classification_of( counter.id ).has_value() );
    EXPECT_EQ( effects->classification_of( gas.id ), change_kind::mutated );
  }

  EXPECT_EQ( latest( counter.id ).version, 1 );
  EXPECT_EQ( latest( counter.id ).contents, counter.contents );
}

TEST_F( integration, created_objects )
{
  auto obj = add_object( protocol::address_owner{ alice } );

  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ), "things", "mint", { builder.owned_object( obj.ref() ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  execution::script s;
  s.writes.push_back( { .id = obj.id } );
  s.creations.push_back( { .owner = protocol::address_owner{ bob }, .type = thing_type() } );
  s.creations.push_back( { .owner = protocol::shared{}, .type = thing_type() } );
  s.creations.push_back( { .owner = protocol::address_owner{ alice }, .type = thing_type(), .deleted = true } );

  auto effects = process( tx, s );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  auto ids = created_ids( tx, 3 );

  EXPECT_EQ( effects->created.size(), 2 );
  EXPECT_EQ( effects->classification_of( ids[ 0 ] ), change_kind::created );
  EXPECT_EQ( effects->classification_of( ids[ 1 ] ), change_kind::created );
  EXPECT_FALSE( effects->classification_of( ids[ 2 ] ).has_value() );

  auto shared = latest( ids[ 1 ] );
  EXPECT_EQ( shared.version, effects->lamport_version );
  EXPECT_EQ( shared.owner, protocol::owner{ protocol::shared{ effects->lamport_version } } );
  EXPECT_FALSE( effects->modified_at( ids[ 0 ] ).has_value() );
}

TEST_F( integration, input_rejections )
{
  auto obj     = add_object( protocol::address_owner{ alice } );
  auto foreign = add_object( protocol::address_owner{ bob } );
  auto parent  = add_object( protocol::address_owner{ alice } );
  auto child   = add_object( protocol::object_owner{ parent.id } );

  auto reject = [ & ]( protocol::transaction_builder& builder, std::error_code expected )
  {
    auto tx      = make_transaction( builder, alice, gas.id );
    auto effects = process( tx );
    ASSERT_FALSE( effects.has_value() );
    EXPECT_EQ( effects.error(), expected );
  };

  {
    auto stale    = obj.ref();
    stale.version = 7;
    protocol::transaction_builder builder;
    builder.transfer_objects( { builder.owned_object( stale ) }, builder.pure( bob ) );
    reject( builder, protocol::user_input_errc::object_version_mismatch );
  }

  {
    auto forged      = obj.ref();
    forged.digest[0] = ~forged.digest[0];
    protocol::transaction_builder builder;
    builder.transfer_objects( { builder.owned_object( forged ) }, builder.pure( bob ) );
    reject( builder, protocol::user_input_errc::object_digest_mismatch );
  }

  {
    protocol::transaction_builder builder;
    builder.transfer_objects( { builder.owned_object( foreign.ref() ) }, builder.pure( bob ) );
    reject( builder, ownership::ownership_errc::incorrect_signer );
  }

  {
    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "touch", { builder.owned_object( child.ref() ) } );
    reject( builder, ownership::ownership_errc::invalid_child_object_argument );
  }

  {
    protocol::transaction_builder builder;
    builder.transfer_objects( { builder.owned_object( gas.ref() ) }, builder.pure( bob ) );
    reject( builder, protocol::user_input_errc::invalid_gas_object );
  }

  {
    protocol::transaction_builder builder;
    builder.publish( {}, {} );
    reject( builder, protocol::user_input_errc::empty_command_input );
  }

  {
    protocol::transaction_builder builder;
    builder.transfer_objects( { builder.owned_object( obj.ref() ) }, builder.pure( bob ) );
    auto tx      = make_transaction( builder, alice, gas.id, 2'000'000 );
    auto effects = process( tx );
    ASSERT_FALSE( effects.has_value() );
    EXPECT_EQ( effects.error(), protocol::user_input_errc::gas_balance_too_low );
  }

  // Rejections leave no trace in the store
  EXPECT_EQ( latest( gas.id ).version, 1 );
  EXPECT_EQ( latest( obj.id ).version, 1 );
}

TEST_F( integration, child_objects_follow_their_parent )
{
  auto parent = add_object( protocol::address_owner{ alice } );
  auto child  = add_object( protocol::object_owner{ parent.id } );

  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ),
                     "things",
                     "touch_child",
                     { builder.owned_object( parent.ref() ), builder.owned_object( child.ref() ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx, { .writes = { { .id = parent.id }, { .id = child.id } } } );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  EXPECT_EQ( latest( child.id ).version, 2 );
  EXPECT_EQ( latest( child.id ).owner, protocol::owner{ protocol::object_owner{ parent.id } } );
}

TEST_F( integration, insufficient_gas )
{
  auto obj = add_object( protocol::address_owner{ alice } );

  protocol::transaction_builder builder;
  builder.move_call( protocol::make_address( 0xee ), "things", "spin", { builder.owned_object( obj.ref() ) } );
  auto tx = make_transaction( builder, alice, gas.id, 50 );

  auto effects = process( tx, { .computation_units = 100, .writes = { { .id = obj.id } } } );
  ASSERT_TRUE( verify( effects, verification::processed ) );
  ASSERT_FALSE( effects->status.success() );
  EXPECT_EQ( effects->status.failure->error, protocol::execution_errc::insufficient_gas );

  EXPECT_EQ( effects->gas_used.computation_cost, 50 );
  EXPECT_EQ( balance( gas.id ), 1'000'000 - 50 );
}

TEST_F( integration, gas_price_below_reference )
{
  test::fixture priced( "priced", "debug", { .reference_gas_price = 5 } );
  auto payer = priced.add_gas( alice );
  auto thing = priced.add_object( protocol::address_owner{ alice } );

  protocol::transaction_builder builder;
  builder.transfer_objects( { builder.owned_object( thing.ref() ) }, builder.pure( bob ) );
  auto tx = priced.make_transaction( builder, alice, payer.id, 1'000, 1 );

  auto effects = priced.process( tx );
  ASSERT_FALSE( effects.has_value() );
  EXPECT_EQ( effects.error(), protocol::user_input_errc::gas_price_too_low );
  EXPECT_EQ( priced.latest( payer.id ).version, 1 );
}

TEST_F( integration, transactions_are_processed_once )
{
  auto obj = add_object( protocol::address_owner{ alice } );

  protocol::transaction_builder builder;
  builder.transfer_objects( { builder.owned_object( obj.ref() ) }, builder.pure( bob ) );
  auto tx = make_transaction( builder, alice, gas.id );

  ASSERT_TRUE(
    verify( process( tx, { .writes = { { .id = obj.id, .owner = protocol::address_owner{ bob } } } } ),
            verification::processed | verification::succeeded ) );

  auto again = process( tx );
  ASSERT_FALSE( again.has_value() );
  EXPECT_EQ( again.error(), controller::controller_errc::already_processed );
}

TEST_F( integration, replay_is_deterministic )
{
  auto run = []( test::fixture& f ) -> protocol::transaction_effects
  {
    auto owner = protocol::make_address( 0xa1 );
    auto payer = f.add_gas( owner );
    auto obj   = f.add_object( protocol::address_owner{ owner } );
    auto kid   = f.add_object( protocol::object_owner{ obj.id } );

    protocol::transaction_builder builder;
    builder.move_call( protocol::make_address( 0xee ), "things", "mix", { builder.owned_object( obj.ref() ) } );
    auto tx = f.make_transaction( builder, owner, payer.id );

    execution::script s;
    s.writes.push_back( { .id = obj.id, .contents = std::vector{ std::byte{ 0x09 } } } );
    s.creations.push_back( { .owner = protocol::address_owner{ owner }, .type = test::fixture::thing_type() } );
    s.creations.push_back( { .owner = protocol::immutable{}, .type = test::fixture::thing_type() } );
    s.wraps.emplace_back( kid.id, obj.id );

    auto effects = f.process( tx, s );
    if( !effects )
      throw std::runtime_error( effects.error().message() );

    return *effects;
  };

  test::fixture first( "replay-a", "debug" );
  test::fixture second( "replay-b", "debug" );

  auto a = run( first );
  auto b = run( second );

  EXPECT_TRUE( a.status.success() );
  EXPECT_EQ( a, b );
  EXPECT_EQ( a.digest(), b.digest() );
  EXPECT_EQ( encode::bcs::to_bytes( a ), encode::bcs::to_bytes( b ) );
}

TEST_F( integration, publish )
{
  auto dir = write_package( "things", { "things", "tools" } );

  auto graph = package::resolve_package( dir );
  ASSERT_TRUE( graph.has_value() );

  package::compiled_package compiled( std::move( *graph ) );
  auto command = compiled.publish_command( false );
  ASSERT_TRUE( command.has_value() );

  protocol::transaction_builder builder;
  builder.command( *command );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  auto ids = created_ids( tx, 2 );
  EXPECT_EQ( effects->created.size(), 2 );

  auto pkg = latest( ids[ 0 ] );
  EXPECT_TRUE( pkg.is_package() );
  EXPECT_EQ( pkg.owner, protocol::owner{ protocol::immutable{} } );

  auto contents = package::decode_package( pkg );
  ASSERT_TRUE( contents.has_value() );
  EXPECT_EQ( contents->modules.size(), 2 );
  EXPECT_TRUE( contents->modules.contains( "tools" ) );

  auto cap = latest( ids[ 1 ] );
  EXPECT_EQ( cap.type, protocol::upgrade_cap_type() );
  EXPECT_EQ( cap.owner, protocol::owner{ protocol::address_owner{ alice } } );

  EXPECT_EQ( effects->gas_used.computation_cost, 10 + 1'000 );
}

TEST_F( integration, publish_with_empty_module )
{
  protocol::transaction_builder builder;
  builder.publish( std::vector< std::vector< std::byte > >( 1 ), {} );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx );
  ASSERT_TRUE( verify( effects, verification::processed ) );
  ASSERT_FALSE( effects->status.success() );
  EXPECT_EQ( effects->status.failure->error, protocol::execution_errc::vm_verification_or_deserialization_error );
  EXPECT_EQ( effects->status.failure->command, 0 );
  EXPECT_TRUE( effects->created.empty() );
}

TEST_F( integration, publish_with_missing_dependency )
{
  protocol::transaction_builder builder;
  builder.publish( { package::make_module( "things" ) }, { protocol::make_address( 0x77 ) } );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx );
  ASSERT_TRUE( verify( effects, verification::processed ) );
  ASSERT_FALSE( effects->status.success() );
  EXPECT_EQ( effects->status.failure->error, package::publish_errc::dependency_not_found );
  EXPECT_EQ( effects->status.failure->command, 0 );
}

TEST_F( integration, unpublished_dependencies )
{
  write_package( "base", { "base" } );
  auto app = write_package( "app", { "app" }, { { "base", "../base" } } );

  auto graph = package::resolve_package( app );
  ASSERT_TRUE( graph.has_value() );

  package::compiled_package compiled( std::move( *graph ) );

  auto refused = compiled.publish_command( false );
  ASSERT_FALSE( refused.has_value() );
  EXPECT_EQ( refused.error().code, package::publish_errc::unpublished_dependency );
  EXPECT_EQ( refused.error().reason,
             "Package dependency \"base\" does not specify a published address (the manifest for \"base\" does not "
             "contain a published-at field).\nIf this is intentional, you may use the --with-unpublished-dependencies "
             "flag to continue publishing these dependencies as part of your package (they won't be linked against "
             "existing packages on-chain)." );

  auto bundled = compiled.publish_command( true );
  ASSERT_TRUE( bundled.has_value() );
  EXPECT_EQ( bundled->modules.size(), 2 );
  EXPECT_TRUE( bundled->dependencies.empty() );

  protocol::transaction_builder builder;
  builder.command( *bundled );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  auto contents = package::decode_package( latest( created_ids( tx, 1 ).front() ) );
  ASSERT_TRUE( contents.has_value() );
  EXPECT_TRUE( contents->modules.contains( "base" ) );
  EXPECT_TRUE( contents->modules.contains( "app" ) );
}

TEST_F( integration, published_dependencies_are_linked )
{
  protocol::object_id base_id;

  {
    protocol::transaction_builder builder;
    builder.publish( { package::make_module( "base" ) }, {} );
    auto tx = make_transaction( builder, alice, gas.id );
    ASSERT_TRUE( verify( process( tx ), verification::processed | verification::succeeded ) );
    base_id = created_ids( tx, 1 ).front();
  }

  write_package( "base", { "base" }, {}, protocol::to_string( base_id ) );
  auto app = write_package( "app", { "app" }, { { "base", "../base" } } );

  auto graph = package::resolve_package( app );
  ASSERT_TRUE( graph.has_value() );

  package::compiled_package compiled( std::move( *graph ) );
  auto command = compiled.publish_command( false );
  ASSERT_TRUE( command.has_value() );
  ASSERT_EQ( command->dependencies.size(), 1 );
  EXPECT_EQ( command->dependencies.front(), base_id );
  EXPECT_EQ( command->modules.size(), 1 );

  protocol::transaction_builder builder;
  builder.command( *command );
  auto tx = make_transaction( builder, alice, gas.id );

  auto effects = process( tx );
  ASSERT_TRUE( verify( effects, verification::processed | verification::succeeded ) );

  // The dependency is read, never written
  EXPECT_FALSE( effects->classification_of( base_id ).has_value() );
  EXPECT_EQ( latest( base_id ).version, 2 );

  auto contents = package::decode_package( latest( created_ids( tx, 1 ).front() ) );
  ASSERT_TRUE( contents.has_value() );
  ASSERT_EQ( contents->linkage.size(), 1 );
  EXPECT_EQ( contents->linkage.front(), base_id );
}

TEST_F( integration, lock_file )
{
  write_package( "base", { "base" } );
  write_package( "util", { "util" }, { { "base", "../base" } } );
  auto app = write_package( "app", { "app" }, { { "util", "../util" }, { "base", "../base" } } );

  auto graph = package::resolve_package( app );
  ASSERT_TRUE( graph.has_value() );

  auto lock = app / package::lock_file_name;
  ASSERT_FALSE( package::write_lock_file( *graph, lock ) );
  ASSERT_TRUE( std::filesystem::exists( lock ) );

  auto again = package::resolve_package( app );
  ASSERT_TRUE( again.has_value() );
  EXPECT_EQ( package::lock_file( *graph ), package::lock_file( *again ) );
}

// NOLINTEND
