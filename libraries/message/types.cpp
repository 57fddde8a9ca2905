#include <ixc/message/types.hpp>

namespace fc {

   void to_variant( const ixc::message::account_id_type& id, fc::variant& v )
   {
      v = id.get();
   }

   void from_variant( const fc::variant& v, ixc::message::account_id_type& id )
   {
      id = ixc::message::account_id_type( v.as_uint64() );
   }

} // fc
