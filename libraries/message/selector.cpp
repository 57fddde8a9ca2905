#include <ixc/message/config.hpp>
#include <ixc/message/selector.hpp>

#include <fc/crypto/city.hpp>

namespace ixc { namespace message {

   uint64_t message_selector( const string& method )
   {
      return fc::city_hash64( method.data(), method.size() );
   }

   uint64_t create_selector()
   {
      static const uint64_t selector = message_selector( IXC_CREATE_METHOD );
      return selector;
   }

   uint64_t on_create_selector()
   {
      static const uint64_t selector = message_selector( IXC_ON_CREATE_METHOD );
      return selector;
   }

} } // ixc::message
