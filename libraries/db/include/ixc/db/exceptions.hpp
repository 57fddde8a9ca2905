#pragma once
#include <fc/exception/exception.hpp>

namespace ixc { namespace db {

   FC_DECLARE_EXCEPTION( state_exception, 3000000, "state exception" )
   FC_DECLARE_DERIVED_EXCEPTION( volatile_access_exception, ixc::db::state_exception, 3000001, "volatile frame access violation" )
   FC_DECLARE_DERIVED_EXCEPTION( no_frames_exception,       ixc::db::state_exception, 3000002, "no frames to pop" )

} } // ixc::db
