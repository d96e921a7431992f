#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <objectum/controller.hpp>
#include <objectum/execution.hpp>
#include <objectum/package.hpp>
#include <objectum/protocol.hpp>
#include <objectum/store.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level, objectum::controller::options opts = {} );
  ~fixture();

  static objectum::protocol::type_tag thing_type();

  /// Seeds the store with a genesis gas coin.
  objectum::protocol::object add_gas( const objectum::protocol::address& owner, std::uint64_t balance = 1'000'000 );

  /// Seeds the store with a genesis object of the given owner.
  objectum::protocol::object add_object( objectum::protocol::owner owner,
                                         objectum::protocol::type_tag type = thing_type(),
                                         std::vector< std::byte > contents = { std::byte{ 0x01 } } );

  objectum::protocol::object latest( const objectum::protocol::object_id& id ) const;
  objectum::protocol::object_ref latest_ref( const objectum::protocol::object_id& id ) const;

  objectum::protocol::transaction make_transaction( objectum::protocol::transaction_builder& builder,
                                                    const objectum::protocol::address& sender,
                                                    const objectum::protocol::object_id& gas,
                                                    std::uint64_t budget = 100'000,
                                                    std::uint64_t price  = 1 ) const;

  /// The ids the controller will assign to objects created by `transaction`.
  static std::vector< objectum::protocol::object_id > created_ids( const objectum::protocol::transaction& transaction,
                                                                   std::size_t count );

  objectum::controller::result< objectum::protocol::transaction_effects >
  process( const objectum::protocol::transaction& transaction, objectum::execution::script s = {} );

  /**
   * Writes a package directory with a Package.yml manifest and one compiled
   * module per name under bytecode_modules.
   */
  std::filesystem::path write_package( const std::string& name,
                                       const std::vector< std::string >& modules,
                                       const std::map< std::string, std::string >& dependencies = {},
                                       const std::string& published_at                       = {} ) const;

  enum verification : std::uint_fast8_t
  {
    none      = 0,
    processed = 1 << 0,
    succeeded = 1 << 1
  };

  bool verify( const objectum::controller::result< objectum::protocol::transaction_effects >& effects,
               std::uint64_t flags ) const;

  std::shared_ptr< objectum::store::memory_store > _store;
  std::shared_ptr< objectum::execution::scripted_executor > _executor;
  std::unique_ptr< objectum::controller::controller > _controller;
  std::filesystem::path _package_dir;
  std::uint8_t _next_id = 0x10;
};

} // namespace test
