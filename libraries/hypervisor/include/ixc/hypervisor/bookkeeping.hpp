#pragma once
#include <ixc/db/state_handler.hpp>
#include <ixc/vm/vm.hpp>

namespace ixc { namespace hypervisor {
   using namespace ixc::message;

   /**
    *  @return the manager namespace key of the handler of account, the
    *  reserved prefix followed by the decimal account id
    */
   bytes handler_key( account_id_type account );
   bytes next_account_id_key();

   optional<vm::handler_id> get_account_handler_id( const db::kv_store& state, account_id_type account );
   void                     set_account_handler_id( db::kv_store& state, account_id_type account, const vm::handler_id& id );

   /**
    *  Hands out the next id from the persisted counter, starting at
    *  IXC_ACCOUNT_ID_NON_RESERVED_START.  The counter is stored as a little
    *  endian u64.
    */
   account_id_type next_account_id( db::kv_store& state );

   /** 8 little endian bytes, the form of the counter and of create results */
   bytes           encode_account_id( account_id_type id );
   account_id_type decode_account_id( buffer<const char> data );

} } // ixc::hypervisor
