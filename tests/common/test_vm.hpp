#pragma once
#include <ixc/vm/vm.hpp>

#include <functional>
#include <map>

namespace ixc { namespace test {
   using namespace ixc::message;

   /**
    *  A virtual machine whose handlers are scripted with std::function, one
    *  per message selector.  Define everything before the registry is built.
    */
   class test_vm : public vm::virtual_machine
   {
      public:
         typedef std::function<void( message_packet&, vm::host_backend& )> method_type;

         void define_handler( const string& handler, optional<bytes> storage_params = optional<bytes>() );
         void define_method( const string& handler, uint64_t selector, method_type method );
         void define_on_create( const string& handler, method_type method );

         /** number of times run_handler() was entered for handler */
         uint32_t calls( const string& handler )const;

         virtual void run_handler( const string& handler_id, message_packet& packet, vm::host_backend& backend )const override;
         virtual optional<vm::handler_descriptor> describe_handler( const string& handler_id )const override;

      private:
         struct handler_type
         {
            vm::handler_descriptor              descriptor;
            std::map<uint64_t, method_type>     methods;
         };

         std::map<string, handler_type>         _handlers;
         mutable std::map<string, uint32_t>     _calls;
   };

   /** stores value under key in the storage of the running account */
   void put( vm::host_backend& backend, const string& key, const string& value );
   optional<string> lookup( vm::host_backend& backend, const string& key );

   inline bytes to_bytes( const string& s ) { return bytes( s.begin(), s.end() ); }

} } // ixc::test
