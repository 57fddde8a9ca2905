#include <ixc/hypervisor/bookkeeping.hpp>
#include <ixc/hypervisor/exec_context.hpp>
#include <ixc/message/exceptions.hpp>
#include <ixc/message/selector.hpp>

#include <fc/log/logger.hpp>

#include <cstddef>
#include <cstring>
#include <new>

namespace ixc { namespace hypervisor {

   /** holds the transaction for the lifetime of the guard */
   class exec_context::transaction_guard
   {
      public:
         explicit transaction_guard( exec_context& context )
         :_context(context)
         {
            if( _context._checked_out.exchange(true) )
               FC_THROW_EXCEPTION( fatal_execution_exception, "the transaction is already in use" );
         }
         ~transaction_guard() { _context._checked_out = false; }

         db::transaction& operator*()const  { return _context._trx;  }
         db::transaction* operator->()const { return &_context._trx; }

      private:
         exec_context& _context;
   };

   exec_context::exec_context( const vm::vm_registry& vms, db::transaction& trx )
   :_vms(vms),_trx(trx),_checked_out(false){}

   void exec_context::invoke( message_packet& packet )
   {
      {
         transaction_guard trx( *this );
         const account_id_type active = trx->active_account();
         if( packet.header().sender_account != active )
            FC_THROW_EXCEPTION( unauthorized_caller_access_exception,
                                "${s} may not send messages while running as ${a}",
                                ("s", packet.header().sender_account)("a", active) );
      }

      if( packet.header().account.is_null() )
         handle_system_message( packet );
      else
         invoke_account( packet );
   }

   void exec_context::invoke_account( message_packet& packet )
   {
      const account_id_type target = packet.header().account;
      vm::handler_id handler;
      const vm::virtual_machine* machine = nullptr;
      {
         transaction_guard trx( *this );
         auto stored = get_account_handler_id( trx->manager_state(), target );
         if( !stored )
            FC_THROW_EXCEPTION( handler_not_found_exception, "account ${a} does not exist", ("a", target) );
         handler = *stored;
         machine = &find_vm( handler );
         push_frame( *trx, target, false );
      }

      dlog( "dispatching ${s} to ${a} (${h})",
            ("s", packet.header().message_selector)("a", target)("h", handler) );
      run_in_frame( *machine, handler.vm_handler_id, packet );
   }

   void exec_context::handle_system_message( message_packet& packet )
   {
      const uint64_t selector = packet.header().message_selector;
      if( selector == create_selector() )
         create_account( packet );
      else
         FC_THROW_EXCEPTION( handler_not_found_exception, "unknown system message ${s}", ("s", selector) );
   }

   void exec_context::create_account( message_packet& packet )
   {
      const message_header& header = packet.header();
      const buffer<const char> init_data = header.in_pointer2.get( packet );

      auto handler = vm::handler_id::parse( header.in_pointer1.get( packet ) );
      if( !handler )
         FC_THROW_EXCEPTION( handler_not_found_exception, "malformed handler id" );
      const vm::virtual_machine& machine = find_vm( *handler );
      auto descriptor = machine.describe_handler( handler->vm_handler_id );
      if( !descriptor )
         FC_THROW_EXCEPTION( handler_not_found_exception, "unknown handler ${h}", ("h", *handler) );

      account_id_type id;
      {
         transaction_guard trx( *this );
         id = next_account_id( trx->manager_state() );
         trx->init_account_storage( id, descriptor->storage_params.valid() ? *descriptor->storage_params : bytes() );
         set_account_handler_id( trx->manager_state(), id, *handler );
         push_frame( *trx, id, true );
      }

      message_header on_create_header;
      on_create_header.account          = id;
      on_create_header.sender_account   = header.sender_account;
      on_create_header.message_selector = on_create_selector();
      on_create_header.in_pointer1.set_slice( init_data );
      message_packet on_create( &on_create_header, sizeof(on_create_header) );

      try {
         run_in_frame( machine, handler->vm_handler_id, on_create );
      } catch( const message_not_handled_exception& ) {
         // implementing on_create is optional
         dlog( "handler ${h} does not implement on_create", ("h", *handler) );
      }

      buffer<char> result = header.out_pointer1.get_mutable( packet );
      if( result.size >= sizeof(uint64_t) )
      {
         const bytes packed = encode_account_id( id );
         memcpy( result.data, packed.data(), packed.size() );
      }

      ilog( "created account ${a} with handler ${h}", ("a", id)("h", *handler) );
   }

   const vm::virtual_machine& exec_context::find_vm( const vm::handler_id& id )const
   {
      const vm::virtual_machine* machine = _vms.find( id.vm );
      if( machine == nullptr )
         FC_THROW_EXCEPTION( handler_not_found_exception, "no virtual machine named ${vm}", ("vm", id.vm) );
      return *machine;
   }

   void exec_context::run_in_frame( const vm::virtual_machine& machine, const string& handler, message_packet& packet )
   {
      try {
         machine.run_handler( handler, packet, *this );
      } catch( ... ) {
         pop_frame( false );
         throw;
      }
      pop_frame( true );
   }

   void exec_context::push_frame( db::transaction& trx, account_id_type account, bool is_volatile )
   {
      try {
         trx.push_frame( account, is_volatile );
      } catch( const db::state_exception& e ) {
         FC_THROW_EXCEPTION( invalid_handler_exception, "unable to open a frame for ${a}: ${e}",
                             ("a", account)("e", e.to_string()) );
      }
   }

   void exec_context::pop_frame( bool commit )
   {
      transaction_guard trx( *this );
      try {
         trx->pop_frame( commit );
      } catch( const db::state_exception& e ) {
         FC_THROW_EXCEPTION( fatal_execution_exception, "unable to close a frame: ${e}", ("e", e.to_string()) );
      }
   }

   char* exec_context::allocate( size_t size, size_t alignment )
   {
      FC_ASSERT( alignment != 0 && (alignment & (alignment - 1)) == 0, "alignment must be a power of two",
                 ("alignment", alignment) );
      FC_ASSERT( alignment <= alignof(std::max_align_t), "unsupported alignment", ("alignment", alignment) );
      return static_cast<char*>( ::operator new( size ) );
   }

   void exec_context::deallocate( char* ptr, size_t, size_t )
   {
      ::operator delete( ptr );
   }

   db::kv_store& exec_context::account_state()
   {
      transaction_guard trx( *this );
      return trx->account_state();
   }

} } // ixc::hypervisor
