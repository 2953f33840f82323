#pragma once
#include <string>
#include <string_view>
#include <fc/reflect/reflect.hpp>
#include <iosfwd>

namespace rebase::ledger {
  struct name;
}
namespace fc {
  class variant;
  void to_variant(const rebase::ledger::name& c, fc::variant& v);
  void from_variant(const fc::variant& v, rebase::ledger::name& check);
} // fc

namespace rebase::ledger {
   inline constexpr uint64_t char_to_symbol( char c ) {
      if( c >= 'a' && c <= 'z' )
         return (c - 'a') + 6;
      if( c >= '1' && c <= '5' )
         return (c - '1') + 1;
      return 0;
   }

   inline constexpr uint64_t string_to_uint64_t( std::string_view str ) {
      uint64_t n = 0;
      int i = 0;
      for ( ; i < str.size() && i < 12; ++i) {
         n |= (char_to_symbol(str[i]) & 0x1f) << (64 - 5 * (i + 1));
      }

      // the 13th character only has the low 4 bits left
      if (i < str.size() && i == 12)
         n |= char_to_symbol(str[12]) & 0x0F;
      return n;
   }

   bool is_string_valid_name( std::string_view str );

   /**
    * Identifies an account in the ledger.
    *
    * Up to 13 characters from ".12345abcdefghijklmnopqrstuvwxyz" packed into 64 bits, the 13th
    * character limited to ".12345abcdefghij". Constructing a name from a string that does not
    * round trip throws name_type_exception.
    */
   struct name {
   private:
      uint64_t value = 0;

      friend struct fc::reflector<name>;
      friend void fc::from_variant(const fc::variant& v, rebase::ledger::name& check);

      void set( std::string_view str );

   public:
      constexpr bool empty()const { return 0 == value; }
      constexpr bool good()const  { return !empty();   }

      explicit name( std::string_view str ) { set( str ); }
      constexpr explicit name( uint64_t v ) : value(v) {}
      constexpr name() = default;

      std::string to_string()const;
      constexpr uint64_t to_uint64_t()const { return value; }

      friend std::ostream& operator << ( std::ostream& out, const name& n ) {
         return out << n.to_string();
      }

      friend constexpr bool operator < ( const name& a, const name& b ) { return a.value < b.value; }
      friend constexpr bool operator > ( const name& a, const name& b ) { return a.value > b.value; }
      friend constexpr bool operator <= ( const name& a, const name& b ) { return a.value <= b.value; }
      friend constexpr bool operator >= ( const name& a, const name& b ) { return a.value >= b.value; }
      friend constexpr bool operator == ( const name& a, const name& b ) { return a.value == b.value; }
      friend constexpr bool operator != ( const name& a, const name& b ) { return a.value != b.value; }

      constexpr explicit operator bool()const { return value != 0; }
   };

   inline constexpr name string_to_name( std::string_view str )
   {
      return name( string_to_uint64_t( str ) );
   }

   inline namespace literals {
#if defined(__clang__)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
      template <typename T, T... Str>
      inline constexpr name operator""_n() {
         constexpr const char buf[] = {Str...};
         return name{std::integral_constant<uint64_t, string_to_uint64_t(std::string_view{buf, sizeof(buf)})>::value};
      }
#if defined(__clang__)
# pragma clang diagnostic pop
#endif
   } // namespace literals

} // rebase::ledger

namespace std {
   template<> struct hash<rebase::ledger::name> : private hash<uint64_t> {
      typedef rebase::ledger::name argument_type;
      size_t operator()(const argument_type& name) const noexcept
      {
         return hash<uint64_t>::operator()(name.to_uint64_t());
      }
   };
};

FC_REFLECT( rebase::ledger::name, (value) )
