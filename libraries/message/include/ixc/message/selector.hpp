#pragma once
#include <ixc/message/types.hpp>

namespace ixc { namespace message {

   /**
    *  @return the 64 bit dispatch key of a method name in the
    *  namespace.version.method form
    */
   uint64_t message_selector( const string& method );

   uint64_t create_selector();
   uint64_t on_create_selector();

} } // ixc::message
