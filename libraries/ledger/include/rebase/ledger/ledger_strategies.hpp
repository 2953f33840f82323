#pragma once
#include <rebase/ledger/ledger_objects.hpp>

#include <iosfwd>

namespace rebase { namespace ledger {

   enum class supply_change_mode {
      derived, ///< total supply is recomputed from the new multiplier
      trusted  ///< total supply is set to the requested value
   };

   enum class transfer_rounding_mode {
      derived,     ///< the side with the smaller multiplier is computed first and the other derived from it
      independent  ///< both sides are converted from the nominal amount on their own
   };

   enum class burn_mode {
      reject_dust, ///< burns that remove no credits fail, non-rebasing supply shrinks by the balance actually removed
      naive        ///< any burn is accepted and non-rebasing supply shrinks by the nominal amount
   };

   std::istream& operator>>(std::istream& in, supply_change_mode& mode);
   std::istream& operator>>(std::istream& in, transfer_rounding_mode& mode);
   std::istream& operator>>(std::istream& in, burn_mode& mode);
   std::ostream& operator<<(std::ostream& osm, supply_change_mode mode);
   std::ostream& operator<<(std::ostream& osm, transfer_rounding_mode mode);
   std::ostream& operator<<(std::ostream& osm, burn_mode mode);

   struct supply_change_result {
      uint256_t rebasing_credits_per_token;
      uint256_t total_supply;
   };

   /**
    * Computes the multiplier and the cached total supply that result from a supply change.
    *
    * The multiplier is the same for every variant: div_precisely( rebasing_credits,
    * new_total_supply - non_rebasing_supply ). A requested supply that does not exceed the
    * non-rebasing supply, or that would drive the multiplier to zero, throws
    * invalid_supply_change_exception.
    */
   class supply_change_strategy {
      public:
         virtual ~supply_change_strategy() = default;

         supply_change_result apply( const ledger_global_object& global, const uint256_t& new_total_supply )const;

         virtual supply_change_mode mode()const = 0;

      protected:
         virtual uint256_t resulting_total_supply( const ledger_global_object& global,
                                                   const uint256_t& rebasing_credits_per_token,
                                                   const uint256_t& new_total_supply )const = 0;
   };

   class derived_supply_change : public supply_change_strategy {
      public:
         supply_change_mode mode()const override { return supply_change_mode::derived; }

      protected:
         uint256_t resulting_total_supply( const ledger_global_object& global,
                                           const uint256_t& rebasing_credits_per_token,
                                           const uint256_t& new_total_supply )const override;
   };

   class trusted_supply_change : public supply_change_strategy {
      public:
         supply_change_mode mode()const override { return supply_change_mode::trusted; }

      protected:
         uint256_t resulting_total_supply( const ledger_global_object& global,
                                           const uint256_t& rebasing_credits_per_token,
                                           const uint256_t& new_total_supply )const override;
   };

   struct transfer_split {
      uint256_t credits_deducted;
      uint256_t credits_credited;
   };

   /**
    * Converts a nominal transfer amount into the credits removed from the sender and the
    * credits added to the recipient, given the multiplier of each side.
    */
   class transfer_rounding_strategy {
      public:
         virtual ~transfer_rounding_strategy() = default;

         virtual transfer_split split( const uint256_t& amount,
                                       const uint256_t& from_credits_per_token,
                                       const uint256_t& to_credits_per_token )const = 0;

         virtual transfer_rounding_mode mode()const = 0;
   };

   class derived_transfer_rounding : public transfer_rounding_strategy {
      public:
         transfer_split split( const uint256_t& amount,
                               const uint256_t& from_credits_per_token,
                               const uint256_t& to_credits_per_token )const override;

         transfer_rounding_mode mode()const override { return transfer_rounding_mode::derived; }
   };

   class independent_transfer_rounding : public transfer_rounding_strategy {
      public:
         transfer_split split( const uint256_t& amount,
                               const uint256_t& from_credits_per_token,
                               const uint256_t& to_credits_per_token )const override;

         transfer_rounding_mode mode()const override { return transfer_rounding_mode::independent; }
   };

   /**
    * Decides whether a burn may proceed and how much it takes out of the non-rebasing supply.
    */
   class burn_policy {
      public:
         virtual ~burn_policy() = default;

         virtual void validate( const account_object& account, const uint256_t& amount, const uint256_t& credit_amount )const = 0;

         virtual uint256_t non_rebasing_supply_reduction( const uint256_t& amount,
                                                          const uint256_t& credit_amount,
                                                          const uint256_t& credits_per_token )const = 0;

         virtual burn_mode mode()const = 0;
   };

   class reject_dust_burn_policy : public burn_policy {
      public:
         void validate( const account_object& account, const uint256_t& amount, const uint256_t& credit_amount )const override;

         uint256_t non_rebasing_supply_reduction( const uint256_t& amount,
                                                  const uint256_t& credit_amount,
                                                  const uint256_t& credits_per_token )const override;

         burn_mode mode()const override { return burn_mode::reject_dust; }
   };

   class naive_burn_policy : public burn_policy {
      public:
         void validate( const account_object& account, const uint256_t& amount, const uint256_t& credit_amount )const override {}

         uint256_t non_rebasing_supply_reduction( const uint256_t& amount,
                                                  const uint256_t& credit_amount,
                                                  const uint256_t& credits_per_token )const override {
            return amount;
         }

         burn_mode mode()const override { return burn_mode::naive; }
   };

   std::unique_ptr<supply_change_strategy>     make_supply_change_strategy( supply_change_mode mode );
   std::unique_ptr<transfer_rounding_strategy> make_transfer_rounding_strategy( transfer_rounding_mode mode );
   std::unique_ptr<burn_policy>                make_burn_policy( burn_mode mode );

} } /// rebase::ledger

FC_REFLECT_ENUM( rebase::ledger::supply_change_mode, (derived)(trusted) )
FC_REFLECT_ENUM( rebase::ledger::transfer_rounding_mode, (derived)(independent) )
FC_REFLECT_ENUM( rebase::ledger::burn_mode, (reject_dust)(naive) )
