#pragma once
#include <ixc/db/state_handler.hpp>
#include <ixc/vm/vm_registry.hpp>

#include <atomic>

namespace ixc { namespace hypervisor {
   using namespace ixc::message;

   /**
    *  @class exec_context
    *  @brief dispatches the messages of one transaction
    *
    *  The context is the host_backend every handler of the transaction runs
    *  against, nested messages re-enter invoke() through it.  The transaction
    *  is checked out only while the context itself works on it and is
    *  released while a handler runs.  Any attempt to use it while it is
    *  checked out throws fatal_execution_exception.
    */
   class exec_context : public vm::host_backend
   {
      public:
         exec_context( const vm::vm_registry& vms, db::transaction& trx );

         /**
          *  Authorizes the sender against the active frame, then routes the
          *  packet to the system account or to the handler of its target in a
          *  frame of its own.
          */
         virtual void invoke( message_packet& packet ) override;

         /** pass-through to the global allocator */
         virtual char* allocate( size_t size, size_t alignment ) override;
         virtual void  deallocate( char* ptr, size_t size, size_t alignment ) override;

         virtual db::kv_store& account_state() override;

      private:
         class transaction_guard;

         void invoke_account( message_packet& packet );
         void handle_system_message( message_packet& packet );
         void create_account( message_packet& packet );

         const vm::virtual_machine& find_vm( const vm::handler_id& id )const;

         /** runs the handler in the frame on top of the stack and pops that frame */
         void run_in_frame( const vm::virtual_machine& machine, const string& handler, message_packet& packet );
         void push_frame( db::transaction& trx, account_id_type account, bool is_volatile );
         void pop_frame( bool commit );

         const vm::vm_registry& _vms;
         db::transaction&       _trx;
         std::atomic<bool>      _checked_out;
   };

} } // ixc::hypervisor
