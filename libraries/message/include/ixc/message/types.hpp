#pragma once
#include <fc/optional.hpp>
#include <fc/variant.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ixc { namespace message {

   using                               std::string;
   using                               std::vector;
   using                               std::shared_ptr;
   using                               std::unique_ptr;

   using                               fc::optional;
   using                               fc::variant;

   typedef vector<char>                bytes;

   /**
    *  @class account_id_type
    *  @brief identifies the principal a message is sent from or to
    *
    *  Ids below IXC_ACCOUNT_ID_NON_RESERVED_START belong to built-in accounts,
    *  id 0 is the system account that receives account lifecycle messages.
    *  The layout is a single u64 because it is embedded in the message header.
    */
   class account_id_type
   {
      public:
         account_id_type():_id(0){}
         explicit account_id_type( uint64_t id ):_id(id){}

         uint64_t get()const     { return _id;      }
         bool     is_null()const { return _id == 0; }

         friend bool operator == ( const account_id_type& a, const account_id_type& b ) { return a._id == b._id; }
         friend bool operator != ( const account_id_type& a, const account_id_type& b ) { return a._id != b._id; }
         friend bool operator <  ( const account_id_type& a, const account_id_type& b ) { return a._id <  b._id; }

      private:
         uint64_t _id;
   };
   static_assert( sizeof(account_id_type) == 8, "account ids are 8 bytes in the message header" );

   /**
    *  A non-owning view of size bytes starting at data.
    */
   template<typename T>
   struct buffer
   {
      buffer():data(nullptr),size(0){}
      buffer( T* d, uint64_t s ):data(d),size(s){}

      T*   begin()const { return data;        }
      T*   end()const   { return data + size; }
      bool empty()const { return size == 0;   }

      T*       data;
      uint64_t size;
   };

   inline buffer<const char> make_buffer( const bytes& b )  { return buffer<const char>( b.data(), b.size() ); }
   inline buffer<const char> make_buffer( const string& s ) { return buffer<const char>( s.data(), s.size() ); }
   inline bytes              to_bytes( buffer<const char> b ) { return bytes( b.begin(), b.end() ); }

} } // ixc::message

namespace fc {
   void to_variant( const ixc::message::account_id_type& id, fc::variant& v );
   void from_variant( const fc::variant& v, ixc::message::account_id_type& id );
}
