#pragma once
#include <ixc/db/exceptions.hpp>
#include <ixc/message/types.hpp>

namespace ixc { namespace db {
   using namespace ixc::message;

   /**
    *  @class kv_store
    *  @brief an opaque byte keyed store
    */
   class kv_store
   {
      public:
         virtual ~kv_store(){}

         virtual optional<bytes> get( const bytes& key )const = 0;
         virtual void            set( const bytes& key, const bytes& value ) = 0;
         virtual void            remove( const bytes& key ) = 0;
   };

   /**
    *  @class transaction
    *  @brief the unit of atomicity the hypervisor executes a message in
    *
    *  A transaction keeps a stack of frames.  Every write made while a frame
    *  is on top of the stack is committed or rolled back with that frame when
    *  it is popped.  The transaction itself ends exactly once, either through
    *  state_handler::commit() or rollback().
    */
   class transaction
   {
      public:
         virtual ~transaction(){}

         virtual void init_account_storage( account_id_type account, const bytes& storage_params ) = 0;

         /**
          *  @throws volatile_access_exception if the frame may not be pushed on
          *  top of the current one, the stack is left unchanged in that case
          */
         virtual void push_frame( account_id_type account, bool is_volatile ) = 0;

         /**
          *  Removes the top frame and keeps its writes when commit is true,
          *  otherwise restores what they overwrote.
          *
          *  @throws no_frames_exception if the stack is empty
          */
         virtual void pop_frame( bool commit ) = 0;

         virtual account_id_type active_account()const = 0;

         /** discards every write made in this transaction */
         virtual void rollback() = 0;

         /** state reserved for hypervisor bookkeeping */
         virtual kv_store& manager_state() = 0;
         /** storage of the account of the top frame */
         virtual kv_store& account_state() = 0;
   };

   class state_handler
   {
      public:
         virtual ~state_handler(){}

         virtual unique_ptr<transaction> new_transaction() = 0;
         virtual void                    commit( unique_ptr<transaction> trx ) = 0;
   };

} } // ixc::db
