#include <ixc/message/data_pointer.hpp>
#include <ixc/message/packet.hpp>

#include <fc/exception/exception.hpp>

#include <limits>

namespace ixc { namespace message {

   buffer<const char> data_pointer::get( const message_packet& packet )const
   {
      if( is_native() )
         return buffer<const char>( reinterpret_cast<const char*>( uintptr_t(_tail) ), _len );

      // 64 bit arithmetic, offset + len must not wrap
      const uint64_t start = _word;
      const uint64_t end   = start + _len;
      if( start < IXC_MESSAGE_HEADER_SIZE || end > packet.size() )
         return buffer<const char>();
      return buffer<const char>( packet.data() + start, _len );
   }

   buffer<char> data_pointer::get_mutable( message_packet& packet )const
   {
      if( is_native() )
         return buffer<char>();

      const uint64_t start = _word;
      const uint64_t end   = start + _len;
      if( start < IXC_MESSAGE_HEADER_SIZE || end > packet.size() )
         return buffer<char>();
      return buffer<char>( packet.data() + start, _len );
   }

   void data_pointer::set_slice( buffer<const char> data )
   {
      FC_ASSERT( data.data != nullptr || data.size == 0 );
      FC_ASSERT( data.size <= std::numeric_limits<uint32_t>::max(), "slice too large for a data pointer", ("size", data.size) );
      _len  = uint32_t(data.size);
      _word = uint32_t(data.size);
      _tail = uint64_t( reinterpret_cast<uintptr_t>(data.data) );
      // an empty slice without an address reads as an empty local pointer
      if( _tail == 0 ) _word = 0;
   }

   void data_pointer::set_local( uint32_t offset, uint32_t len )
   {
      _len  = len;
      _word = offset;
      _tail = 0;
   }

} } // ixc::message
