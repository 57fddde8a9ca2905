#pragma once
#include <ixc/db/state_handler.hpp>
#include <ixc/message/packet.hpp>

#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

namespace ixc { namespace vm {
   using namespace ixc::message;

   /**
    *  @class handler_id
    *  @brief names the virtual machine and the handler inside it that back an account
    *
    *  Serialized as "vm:handler".
    */
   struct handler_id
   {
      handler_id(){}
      handler_id( string vm_name, string handler ):vm(std::move(vm_name)),vm_handler_id(std::move(handler)){}

      string vm;
      string vm_handler_id;

      string to_string()const;

      /**
       *  @return the first two ':' separated fields of value, or nothing if
       *  there is no separator
       */
      static optional<handler_id> parse( buffer<const char> value );

      friend bool operator == ( const handler_id& a, const handler_id& b )
      { return a.vm == b.vm && a.vm_handler_id == b.vm_handler_id; }
   };

   struct handler_descriptor
   {
      optional<bytes> storage_params;
   };

   /**
    *  @class host_backend
    *  @brief the callbacks a running handler may use
    */
   class host_backend
   {
      public:
         virtual ~host_backend(){}

         /** sends a nested message, throws whatever the callee threw */
         virtual void invoke( message_packet& packet ) = 0;

         virtual char* allocate( size_t size, size_t alignment ) = 0;
         virtual void  deallocate( char* ptr, size_t size, size_t alignment ) = 0;

         /** storage of the account the handler is running as */
         virtual db::kv_store& account_state() = 0;
   };

   /**
    *  @class virtual_machine
    *  @brief an execution engine the hypervisor routes messages to
    *
    *  A registered virtual machine is shared by every hypervisor and thread
    *  that uses the registry, run_handler() must be safe to call concurrently.
    */
   class virtual_machine
   {
      public:
         virtual ~virtual_machine(){}

         /**
          *  Runs handler_id against packet.  Throws message_not_handled_exception
          *  if the handler has no method for the packet's selector.
          */
         virtual void run_handler( const string& handler_id, message_packet& packet, host_backend& backend )const = 0;

         virtual optional<handler_descriptor> describe_handler( const string& handler_id )const = 0;
   };

} } // ixc::vm

FC_REFLECT( ixc::vm::handler_id, (vm)(vm_handler_id) )
FC_REFLECT( ixc::vm::handler_descriptor, (storage_params) )
