#pragma once
#include <ixc/message/header.hpp>

namespace ixc { namespace message {

   /**
    *  @class message_packet
    *  @brief a view of a message header followed by optional inline payload
    *
    *  The packet does not own its memory.
    */
   class message_packet
   {
      public:
         message_packet( message_header* header, uint64_t len );

         message_header&       header()      { return *_header; }
         const message_header& header()const { return *_header; }

         char*       data()       { return reinterpret_cast<char*>(_header);       }
         const char* data()const  { return reinterpret_cast<const char*>(_header); }
         uint64_t    size()const  { return _len; }

      private:
         message_header* _header;
         uint64_t        _len;
   };

   /**
    *  @class packet_builder
    *  @brief owns the memory of a packet and lays out inline payload behind the header
    *
    *  Payload appended through a header slot is referenced with a local
    *  pointer, so the packet stays valid when it is copied or moved as a whole.
    */
   class packet_builder
   {
      public:
         packet_builder( account_id_type sender, account_id_type target, uint64_t selector );

         message_header& header();

         /** copies data behind the payload written so far and points slot at it */
         void append( data_pointer message_header::* slot, buffer<const char> data );
         /** appends len zeroed bytes for the handler to write results into */
         void reserve( data_pointer message_header::* slot, uint32_t len );

         message_packet packet();
         uint64_t       size()const { return _len; }

      private:
         char* grow( uint64_t len );

         vector<uint64_t> _storage;
         uint64_t         _len;
   };

} } // ixc::message
