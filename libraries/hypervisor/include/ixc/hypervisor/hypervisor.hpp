#pragma once
#include <ixc/db/state_handler.hpp>
#include <ixc/vm/vm_registry.hpp>

namespace ixc { namespace hypervisor {
   using namespace ixc::message;

   /**
    *  @class hypervisor
    *  @brief executes every inbound message in a transaction of its own
    *
    *  Any number of hypervisors may share one registry, each invoke() runs
    *  independently of the others.
    */
   class hypervisor
   {
      public:
         hypervisor( db::state_handler& state, shared_ptr<const vm::vm_registry> vms );

         /**
          *  Runs packet as its sender.  Commits everything the message and its
          *  nested messages wrote when it returns, rolls all of it back and
          *  rethrows when anything fails.
          */
         void invoke( message_packet& packet );

         const vm::vm_registry& vms()const { return *_vms; }

      private:
         db::state_handler&             _state;
         shared_ptr<const vm::vm_registry> _vms;
   };

} } // ixc::hypervisor
