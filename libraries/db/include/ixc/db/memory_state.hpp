#pragma once
#include <ixc/db/state_handler.hpp>

#include <map>
#include <mutex>

namespace ixc { namespace db {

   enum state_space
   {
      manager_space,         ///< hypervisor bookkeeping
      account_data_space,    ///< key/value data owned by an account
      account_params_space   ///< storage parameters an account was initialized with
   };

   struct state_key
   {
      state_key():space(manager_space),account(0){}
      state_key( state_space s, uint64_t a, bytes k ):space(s),account(a),key(std::move(k)){}

      state_space space;
      uint64_t    account;
      bytes       key;

      friend bool operator < ( const state_key& a, const state_key& b )
      {
         if( a.space != b.space )     return a.space < b.space;
         if( a.account != b.account ) return a.account < b.account;
         return a.key < b.key;
      }
   };

   typedef std::map<state_key, bytes> state_map;

   /**
    *  @class memory_state
    *  @brief keeps committed state in memory
    *
    *  Each transaction reads from the state that was committed when it was
    *  opened and buffers its own writes.  Committing publishes those writes
    *  in one step, transactions that touch the same keys are not detected,
    *  the last one to commit wins.
    */
   class memory_state : public state_handler
   {
      public:
         memory_state();

         virtual unique_ptr<transaction> new_transaction() override;
         virtual void                    commit( unique_ptr<transaction> trx ) override;

         /**
          * @{
          * @group Committed state queries
          */
         optional<bytes> get( account_id_type account, const bytes& key )const;
         optional<bytes> get_manager( const bytes& key )const;
         optional<bytes> storage_params( account_id_type account )const;
         bool            account_exists( account_id_type account )const;
         ///@}

      private:
         optional<bytes> find( const state_key& key )const;

         mutable std::mutex          _mutex;
         shared_ptr<const state_map> _committed;
   };

} } // ixc::db
