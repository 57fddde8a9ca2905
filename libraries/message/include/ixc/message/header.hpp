#pragma once
#include <ixc/message/data_pointer.hpp>

namespace ixc { namespace message {

   /**
    *  @class message_header
    *  @brief the fixed size record at the start of every message packet
    *
    *  Inputs are passed through the two in pointers, handlers return their
    *  results through the out pointers.
    */
   struct message_header
   {
      message_header();

      account_id_type account;         ///< the target account
      account_id_type sender_account;
      uint64_t        message_selector;

      data_pointer    in_pointer1;
      data_pointer    in_pointer2;
      data_pointer    out_pointer1;
      data_pointer    out_pointer2;

      char            reserved[ IXC_MESSAGE_HEADER_SIZE - 3*8 - IXC_MESSAGE_POINTER_SLOTS*IXC_DATA_POINTER_SIZE ];
   };
   static_assert( sizeof(message_header) == IXC_MESSAGE_HEADER_SIZE, "message header has a fixed wire size" );

} } // ixc::message
