#include <ixc/hypervisor/exec_context.hpp>
#include <ixc/hypervisor/hypervisor.hpp>
#include <ixc/message/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace ixc { namespace hypervisor {

   hypervisor::hypervisor( db::state_handler& state, shared_ptr<const vm::vm_registry> vms )
   :_state(state),_vms(std::move(vms))
   {
      FC_ASSERT( _vms, "a hypervisor needs a virtual machine registry" );
   }

   void hypervisor::invoke( message_packet& packet )
   {
      unique_ptr<db::transaction> trx = _state.new_transaction();
      try {
         try {
            trx->push_frame( packet.header().sender_account, false );
         } catch( const db::state_exception& e ) {
            FC_THROW_EXCEPTION( invalid_handler_exception, "unable to open a frame for ${a}: ${e}",
                                ("a", packet.header().sender_account)("e", e.to_string()) );
         }

         exec_context context( *_vms, *trx );
         context.invoke( packet );
      } catch( const fc::exception& e ) {
         wlog( "rolling back message ${s} from ${a}: ${e}",
               ("s", packet.header().message_selector)("a", packet.header().sender_account)("e", e.to_string()) );
         trx->rollback();
         throw;
      } catch( ... ) {
         wlog( "rolling back message ${s} from ${a}",
               ("s", packet.header().message_selector)("a", packet.header().sender_account) );
         trx->rollback();
         throw;
      }

      _state.commit( std::move(trx) );
   }

} } // ixc::hypervisor
