#pragma once
#include <ixc/message/config.hpp>
#include <ixc/message/types.hpp>

namespace ixc { namespace message {

   class message_packet;

   /**
    *  @class data_pointer
    *  @brief a 16 byte reference to the input or output data of a message
    *
    *  The trailing 8 bytes select one of two interpretations:
    *
    *  - local:  { len, offset, 0 } denotes len bytes at offset inside the
    *            packet that carries the header.
    *  - native: { len, capacity, address } denotes len bytes of memory owned
    *            outside of the packet.  The address is never zero for a
    *            non-empty native pointer.
    *
    *  Native pointers are trusted completely, whoever sets one must keep the
    *  memory alive and unchanged for as long as the message is being handled.
    */
   class data_pointer
   {
      public:
         data_pointer():_len(0),_word(0),_tail(0){}

         bool     is_local()const  { return _tail == 0; }
         bool     is_native()const { return _tail != 0; }
         uint32_t size()const      { return _len;       }

         /** only meaningful for local pointers */
         uint32_t offset()const    { return _word;      }
         /** only meaningful for native pointers */
         uint32_t capacity()const  { return _word;      }

         /**
          *  @return the bytes this pointer denotes.  A local range that starts
          *  inside the header or ends past the packet yields an empty view
          *  instead of an error.
          */
         buffer<const char> get( const message_packet& packet )const;

         /**
          *  @return a writable view of a valid local range, native pointers and
          *  invalid ranges yield an empty view.
          */
         buffer<char>       get_mutable( message_packet& packet )const;

         /**
          *  Points this slot at externally owned memory, overwriting whatever it
          *  held before.  Use it to initialize a slot, not to redirect one whose
          *  local range is still needed.
          */
         void set_slice( buffer<const char> data );
         void set_local( uint32_t offset, uint32_t len );
         void clear() { _len = 0; _word = 0; _tail = 0; }

      private:
         uint32_t _len;
         uint32_t _word;  ///< offset of a local pointer, capacity of a native one
         uint64_t _tail;  ///< zero for a local pointer, the address of a native one
   };
   static_assert( sizeof(data_pointer) == IXC_DATA_POINTER_SIZE, "data pointers are 16 bytes on the wire" );

} } // ixc::message
