#pragma once

#include <fc/exception/exception.hpp>
#include <boost/interprocess/exceptions.hpp>


#define REBASE_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

#define REBASE_THROW( exc_type, FORMAT, ... ) \
    throw exc_type( FC_LOG_MESSAGE( error, FORMAT, __VA_ARGS__ ) );

/**
 * Rethrows anything that is not already a ledger_exception as "exception_type", keeping the
 * original log messages.
 */
#define REBASE_RETHROW_EXCEPTIONS( exception_type, FORMAT, ... ) \
   catch( const std::bad_alloc& ) {\
      throw;\
   } catch( const boost::interprocess::bad_alloc& ) {\
      throw;\
   } catch (rebase::ledger::ledger_exception& e) { \
      FC_RETHROW_EXCEPTION( e, warn, FORMAT, __VA_ARGS__ ); \
   } catch (fc::exception& e) { \
      exception_type new_exception(FC_LOG_MESSAGE( warn, FORMAT, __VA_ARGS__ )); \
      for (const auto& log: e.get_log()) { \
         new_exception.append_log(log); \
      } \
      throw new_exception; \
   } catch( const std::exception& e ) {  \
      exception_type fce(FC_LOG_MESSAGE( warn, FORMAT" (${what})" ,__VA_ARGS__("what",e.what()))); \
      throw fce;\
   } catch( ... ) {  \
      throw fc::unhandled_exception( \
                FC_LOG_MESSAGE( warn, FORMAT,__VA_ARGS__), \
                std::current_exception() ); \
   }

namespace rebase { namespace ledger {

   FC_DECLARE_DERIVED_EXCEPTION( ledger_exception, fc::exception,
                                 4000000, "ledger exception" )
   /**
    *  ledger_exception
    *   |- ledger_type_exception
    *   |- math_exception
    *   |- balance_exception
    *   |- state_transition_exception
    *   |- ledger_state_exception
    *   |- ledger_config_exception
    */

   FC_DECLARE_DERIVED_EXCEPTION( ledger_type_exception, ledger_exception,
                                 4010000, "ledger type exception" )

      FC_DECLARE_DERIVED_EXCEPTION( name_type_exception,               ledger_type_exception,
                                    4010001, "Invalid name" )
      FC_DECLARE_DERIVED_EXCEPTION( operation_type_exception,          ledger_type_exception,
                                    4010002, "Invalid operation" )


   FC_DECLARE_DERIVED_EXCEPTION( math_exception, ledger_exception,
                                 4020000, "Fixed point math exception" )

      FC_DECLARE_DERIVED_EXCEPTION( arithmetic_overflow_exception,     math_exception,
                                    4020001, "Arithmetic overflow" )
      FC_DECLARE_DERIVED_EXCEPTION( division_by_zero_exception,        math_exception,
                                    4020002, "Division by zero" )


   FC_DECLARE_DERIVED_EXCEPTION( balance_exception, ledger_exception,
                                 4030000, "Balance exception" )

      FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance_exception,    balance_exception,
                                    4030001, "Insufficient balance" )
      FC_DECLARE_DERIVED_EXCEPTION( insufficient_credits_exception,    balance_exception,
                                    4030002, "Insufficient credits" )
      FC_DECLARE_DERIVED_EXCEPTION( dust_amount_burn_exception,        balance_exception,
                                    4030003, "Burn amount is dust under the current multiplier" )


   FC_DECLARE_DERIVED_EXCEPTION( state_transition_exception, ledger_exception,
                                 4040000, "State transition exception" )

      FC_DECLARE_DERIVED_EXCEPTION( already_in_state_exception,        state_transition_exception,
                                    4040001, "Account is already in the requested rebasing state" )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_supply_change_exception,   state_transition_exception,
                                    4040002, "Invalid supply change" )


   FC_DECLARE_DERIVED_EXCEPTION( ledger_state_exception, ledger_exception,
                                 4050000, "Ledger state exception" )

      FC_DECLARE_DERIVED_EXCEPTION( ledger_state_inconsistent,         ledger_state_exception,
                                    4050001, "Ledger aggregate would become inconsistent" )


   FC_DECLARE_DERIVED_EXCEPTION( ledger_config_exception, ledger_exception,
                                 4060000, "Invalid ledger configuration" )

} } // rebase::ledger
