#pragma once

#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <objectum/package/error.hpp>
#include <objectum/package/resolution.hpp>
#include <objectum/protocol/object.hpp>
#include <objectum/protocol/transaction.hpp>

namespace objectum::package {

using module_bytes = std::vector< std::byte >;

/**
 * Rejects a publish whose module list is empty with
 * user_input_errc::empty_command_input. An empty or undecodable module, the same
 * bytes twice or the same declared name twice is
 * execution_errc::vm_verification_or_deserialization_error.
 */
std::error_code check_modules( const std::vector< module_bytes >& modules );

struct dependency_split
{
  std::map< std::string, protocol::address > published;
  std::vector< std::string > unpublished;
};

dependency_split gather_dependencies( const resolution_graph& graph );

std::optional< module_publish_failure > check_unpublished_dependencies( const std::vector< std::string >& unpublished );

class compiled_package
{
public:
  explicit compiled_package( resolution_graph graph );

  const resolution_graph& graph() const noexcept;
  const dependency_split& dependencies() const noexcept;

  /**
   * The modules to publish. With `with_unpublished_dependencies` the modules of
   * every unpublished dependency are bundled ahead of the root package's own.
   */
  std::vector< module_bytes > package_bytes( bool with_unpublished_dependencies ) const;
  std::vector< protocol::object_id > dependency_ids() const;

  std::expected< protocol::publish, module_publish_failure >
  publish_command( bool with_unpublished_dependencies ) const;

private:
  resolution_graph _graph;
  dependency_split _dependencies;
};

struct package_contents
{
  std::map< std::string, module_bytes > modules;
  std::vector< protocol::object_id > linkage;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & modules;
    ar & linkage;
  }
};

struct upgrade_cap
{
  protocol::object_id id{};
  protocol::object_id package{};
  std::uint64_t version = 1;
  std::uint8_t policy   = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int )
  {
    ar & id;
    ar & package;
    ar & version;
    ar & policy;
  }
};

struct published_package
{
  protocol::object package;
  protocol::object upgrade_cap;
};

using package_lookup = std::function< const protocol::object*( const protocol::object_id& ) >;

/**
 * Produces the immutable package object and the sender owned upgrade
 * capability for a checked publish command. Every linked dependency must
 * resolve to a package object through `lookup`.
 */
result< published_package > publish( const protocol::publish& command,
                                     const protocol::address& sender,
                                     const protocol::transaction_digest& digest,
                                     protocol::id_generator& ids,
                                     const package_lookup& lookup );

result< package_contents > decode_package( const protocol::object& obj );

} // namespace objectum::package
