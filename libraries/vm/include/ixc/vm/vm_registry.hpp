#pragma once
#include <ixc/vm/vm.hpp>

#include <map>

namespace ixc { namespace vm {

   /**
    *  @class vm_registry
    *  @brief the read only set of virtual machines a hypervisor routes to
    *
    *  Only a vm_registry_builder can create one, after that it never changes
    *  and may be shared between hypervisors and threads.
    */
   class vm_registry
   {
      public:
         /** @return nullptr if no virtual machine is registered under name */
         const virtual_machine* find( const string& name )const;

         size_t         size()const { return _vms.size(); }
         vector<string> names()const;

      private:
         friend class vm_registry_builder;
         explicit vm_registry( std::map<string, unique_ptr<virtual_machine>> vms );

         std::map<string, unique_ptr<virtual_machine>> _vms;
   };

   class vm_registry_builder
   {
      public:
         void register_vm( const string& name, unique_ptr<virtual_machine> vm );

         template<typename VirtualMachineType, typename... Args>
         VirtualMachineType& register_vm( const string& name, Args&&... args )
         {
            auto vm = new VirtualMachineType( std::forward<Args>(args)... );
            register_vm( name, unique_ptr<virtual_machine>(vm) );
            return *vm;
         }

         /** hands out the registry, no virtual machine can be registered afterwards */
         shared_ptr<const vm_registry> build();

      private:
         std::map<string, unique_ptr<virtual_machine>> _vms;
         bool                                          _built = false;
   };

} } // ixc::vm
