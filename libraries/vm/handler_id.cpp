#include <ixc/vm/vm.hpp>

#include <algorithm>

namespace ixc { namespace vm {

   string handler_id::to_string()const
   {
      return vm + ':' + vm_handler_id;
   }

   optional<handler_id> handler_id::parse( buffer<const char> value )
   {
      auto sep = std::find( value.begin(), value.end(), ':' );
      if( sep == value.end() )
         return optional<handler_id>();

      // anything after a second separator is ignored
      auto rest = sep + 1;
      auto end  = std::find( rest, value.end(), ':' );
      return handler_id( string( value.begin(), sep ), string( rest, end ) );
   }

} } // ixc::vm
