#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include <objectum/controller/error.hpp>
#include <objectum/execution.hpp>
#include <objectum/protocol.hpp>
#include <objectum/store.hpp>

namespace objectum::controller {

struct options
{
  std::size_t max_ownership_depth = ownership::default_max_ownership_depth;
  std::size_t max_cascade_size    = execution::default_max_cascade_size;
  std::uint64_t reference_gas_price = 1;
  std::uint64_t command_cost        = 10;
  std::uint64_t publish_cost        = 1'000;
};

class controller
{
public:
  controller( std::shared_ptr< store::object_store > store,
              std::shared_ptr< execution::executor > executor,
              options opts                                 = {},
              const execution::signature_resolver* resolver = nullptr );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /**
   * Runs one transaction end to end. Input errors come back as the unexpected
   * value and leave the store untouched. A transaction that ran, successfully
   * or not, is committed and its effects returned.
   */
  result< protocol::transaction_effects > process( const protocol::transaction& transaction );

  result< protocol::object > get_object_info( const protocol::object_id& id ) const;

  const options& get_options() const noexcept;

private:
  std::shared_ptr< store::object_store > _store;
  std::shared_ptr< execution::executor > _executor;
  options _options;
  const execution::signature_resolver* _resolver;
  mutable std::mutex _mutex;
};

} // namespace objectum::controller
