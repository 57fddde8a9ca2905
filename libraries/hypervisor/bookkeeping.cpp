#include <ixc/hypervisor/bookkeeping.hpp>
#include <ixc/hypervisor/config.hpp>
#include <ixc/message/exceptions.hpp>

#include <fc/io/raw.hpp>

#include <boost/endian/conversion.hpp>

namespace ixc { namespace hypervisor {

   bytes handler_key( account_id_type account )
   {
      const string key = IXC_HANDLER_KEY_PREFIX + std::to_string( account.get() );
      return bytes( key.begin(), key.end() );
   }

   bytes next_account_id_key()
   {
      const string key = IXC_NEXT_ACCOUNT_ID_KEY;
      return bytes( key.begin(), key.end() );
   }

   optional<vm::handler_id> get_account_handler_id( const db::kv_store& state, account_id_type account )
   {
      auto value = state.get( handler_key(account) );
      if( !value )
         return optional<vm::handler_id>();
      return vm::handler_id::parse( make_buffer(*value) );
   }

   void set_account_handler_id( db::kv_store& state, account_id_type account, const vm::handler_id& id )
   {
      FC_ASSERT( id.vm.find(IXC_HANDLER_ID_SEPARATOR) == string::npos, "invalid virtual machine name", ("vm", id.vm) );
      const string value = id.to_string();
      state.set( handler_key(account), bytes( value.begin(), value.end() ) );
   }

   account_id_type next_account_id( db::kv_store& state )
   {
      const bytes key = next_account_id_key();
      uint64_t id = IXC_ACCOUNT_ID_NON_RESERVED_START;

      auto stored = state.get(key);
      if( stored )
      {
         if( stored->size() != sizeof(uint64_t) )
            FC_THROW_EXCEPTION( message::fatal_execution_exception, "corrupt account id counter",
                                ("size", stored->size()) );
         id = decode_account_id( make_buffer(*stored) ).get();
      }

      state.set( key, encode_account_id( account_id_type(id + 1) ) );
      return account_id_type(id);
   }

   bytes encode_account_id( account_id_type id )
   {
      return fc::raw::pack( boost::endian::native_to_little( id.get() ) );
   }

   account_id_type decode_account_id( buffer<const char> data )
   {
      FC_ASSERT( data.size == sizeof(uint64_t), "account ids are 8 bytes", ("size", data.size) );
      const uint64_t id = fc::raw::unpack<uint64_t>( to_bytes(data) );
      return account_id_type( boost::endian::little_to_native( id ) );
   }

} } // ixc::hypervisor
