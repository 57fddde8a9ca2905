#pragma once
#include <fc/exception/exception.hpp>

namespace ixc { namespace message {

   /**
    *  Raised by the hypervisor when routing, authorizing or framing a message
    *  fails.  Any of these aborts the enclosing transaction.
    */
   FC_DECLARE_EXCEPTION( system_exception, 1000000, "hypervisor system error" )
   FC_DECLARE_DERIVED_EXCEPTION( handler_not_found_exception,          ixc::message::system_exception, 1000001, "handler not found" )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_handler_exception,            ixc::message::system_exception, 1000002, "invalid handler" )
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_caller_access_exception, ixc::message::system_exception, 1000003, "unauthorized caller access" )
   FC_DECLARE_DERIVED_EXCEPTION( fatal_execution_exception,            ixc::message::system_exception, 1000004, "fatal execution error" )

   /**
    *  Raised by handlers.  Callers may choose to tolerate these.
    */
   FC_DECLARE_EXCEPTION( handler_exception, 2000000, "handler error" )
   FC_DECLARE_DERIVED_EXCEPTION( message_not_handled_exception, ixc::message::handler_exception, 2000001, "message not handled" )

} } // ixc::message
