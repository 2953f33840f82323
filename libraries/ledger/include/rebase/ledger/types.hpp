#pragma once
#include <rebase/ledger/name.hpp>

#include <chainbase/chainbase.hpp>

#include <fc/variant.hpp>
#include <fc/reflect/reflect.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

#define OBJECT_CTOR(NAME) \
    NAME() = delete; \
    public: \
    template<typename Constructor, typename Allocator> \
    NAME(Constructor&& c, chainbase::allocator<Allocator>) \
    { c(*this); }

namespace rebase { namespace ledger {
   using                               std::vector;
   using                               std::string;
   using                               std::pair;

   /**
    * Every quantity kept by the ledger (credits, multipliers, balances and supplies) is an
    * unsigned 256 bit integer. Signed deltas and the rounding error accumulator are 256 bit
    * signed integers. The 512 bit type only appears as an intermediate inside fixed point math.
    *
    * These are fixed width and allocator free so they can live inside chainbase objects.
    */
   using uint256_t = boost::multiprecision::uint256_t;
   using int256_t  = boost::multiprecision::int256_t;
   using uint512_t = boost::multiprecision::uint512_t;

   using account_name = name;

   /**
    * List all object types here so they can be easily reflected and displayed in debug output.
    *
    * The offsets in this enumeration are potentially shared_memory breaking
    */
   enum object_type
   {
      null_object_type = 0,
      account_object_type,
      ledger_global_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

} }  // rebase::ledger

FC_REFLECT_ENUM(rebase::ledger::object_type,
                (null_object_type)
                (account_object_type)
                (ledger_global_object_type)
                (OBJECT_TYPE_COUNT)
               )
