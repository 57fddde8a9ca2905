#include <ixc/message/packet.hpp>

#include <fc/exception/exception.hpp>

#include <cstring>
#include <new>
#include <limits>

namespace ixc { namespace message {

   message_header::message_header()
   :message_selector(0)
   {
      memset( reserved, 0, sizeof(reserved) );
   }

   message_packet::message_packet( message_header* header, uint64_t len )
   :_header(header),_len(len)
   {
      FC_ASSERT( header != nullptr );
      FC_ASSERT( len >= IXC_MESSAGE_HEADER_SIZE, "packet shorter than its header", ("len", len) );
   }

   packet_builder::packet_builder( account_id_type sender, account_id_type target, uint64_t selector )
   :_storage( IXC_MESSAGE_HEADER_SIZE / sizeof(uint64_t) ),_len(IXC_MESSAGE_HEADER_SIZE)
   {
      message_header* h = new (_storage.data()) message_header();
      h->account          = target;
      h->sender_account   = sender;
      h->message_selector = selector;
   }

   message_header& packet_builder::header()
   {
      return *reinterpret_cast<message_header*>( _storage.data() );
   }

   char* packet_builder::grow( uint64_t len )
   {
      FC_ASSERT( _len + len <= std::numeric_limits<uint32_t>::max(), "packet payload too large", ("len", _len + len) );
      const uint64_t offset = _len;
      _len += len;
      _storage.resize( (_len + sizeof(uint64_t) - 1) / sizeof(uint64_t), 0 );
      return reinterpret_cast<char*>( _storage.data() ) + offset;
   }

   void packet_builder::append( data_pointer message_header::* slot, buffer<const char> data )
   {
      const uint32_t offset = uint32_t(_len);
      const char* base = reinterpret_cast<const char*>( _storage.data() );
      const bool aliased = data.size && data.data >= base && data.data < base + _len;
      const uint64_t source = aliased ? uint64_t(data.data - base) : 0;

      // grow() may reallocate the storage data points into
      char* dest = grow( data.size );
      if( aliased )
         memcpy( dest, reinterpret_cast<const char*>( _storage.data() ) + source, data.size );
      else if( data.size )
         memcpy( dest, data.data, data.size );
      (header().*slot).set_local( offset, uint32_t(data.size) );
   }

   void packet_builder::reserve( data_pointer message_header::* slot, uint32_t len )
   {
      const uint32_t offset = uint32_t(_len);
      grow( len );
      (header().*slot).set_local( offset, len );
   }

   message_packet packet_builder::packet()
   {
      return message_packet( &header(), _len );
   }

} } // ixc::message
