#include <ixc/vm/vm_registry.hpp>

#include <fc/log/logger.hpp>

namespace ixc { namespace vm {

   vm_registry::vm_registry( std::map<string, unique_ptr<virtual_machine>> vms )
   :_vms(std::move(vms)){}

   const virtual_machine* vm_registry::find( const string& name )const
   {
      auto itr = _vms.find(name);
      if( itr == _vms.end() )
         return nullptr;
      return itr->second.get();
   }

   vector<string> vm_registry::names()const
   {
      vector<string> result;
      result.reserve( _vms.size() );
      for( const auto& item : _vms )
         result.push_back( item.first );
      return result;
   }

   void vm_registry_builder::register_vm( const string& name, unique_ptr<virtual_machine> vm )
   { try {
      FC_ASSERT( !_built, "the registry has already been published" );
      FC_ASSERT( !name.empty() );
      FC_ASSERT( vm );
      FC_ASSERT( _vms.find(name) == _vms.end(), "a virtual machine is already registered under this name" );
      _vms.emplace( name, std::move(vm) );
   } FC_CAPTURE_AND_RETHROW( (name) ) }

   shared_ptr<const vm_registry> vm_registry_builder::build()
   {
      FC_ASSERT( !_built, "the registry has already been published" );
      _built = true;
      ilog( "publishing ${n} virtual machines", ("n", _vms.size()) );
      return shared_ptr<const vm_registry>( new vm_registry( std::move(_vms) ) );
   }

} } // ixc::vm
