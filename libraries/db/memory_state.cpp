#include <ixc/db/memory_state.hpp>

#include <fc/log/logger.hpp>

#include <deque>

namespace ixc { namespace db {

namespace detail {

   class memory_transaction;

   /** exposes one space of a transaction as a kv_store */
   class space_store : public kv_store
   {
      public:
         space_store( memory_transaction& trx, state_space space ):_trx(trx),_space(space){}

         virtual optional<bytes> get( const bytes& key )const override;
         virtual void            set( const bytes& key, const bytes& value ) override;
         virtual void            remove( const bytes& key ) override;

      private:
         state_key make_key( const bytes& key )const;

         memory_transaction& _trx;
         state_space         _space;
   };

   class memory_transaction : public transaction
   {
      public:
         explicit memory_transaction( shared_ptr<const state_map> snapshot )
         :_snapshot(std::move(snapshot)),_manager(*this, manager_space),_account(*this, account_data_space){}

         virtual void init_account_storage( account_id_type account, const bytes& storage_params ) override
         {
            FC_ASSERT( !_finished );
            write( state_key( account_params_space, account.get(), bytes() ), storage_params );
         }

         virtual void push_frame( account_id_type account, bool is_volatile ) override
         {
            FC_ASSERT( !_finished );
            if( !is_volatile && !_frames.empty() && _frames.back().is_volatile )
               FC_THROW_EXCEPTION( volatile_access_exception,
                                   "tried to push a non-volatile frame for ${a} on top of a volatile frame for ${b}",
                                   ("a", account)("b", _frames.back().account) );
            _frames.emplace_back( account, is_volatile );
         }

         virtual void pop_frame( bool commit ) override
         {
            if( _frames.empty() )
               FC_THROW_EXCEPTION( no_frames_exception, "the frame stack is empty" );

            frame& top = _frames.back();
            if( commit )
            {
               // the parent keeps its own, older, record of every key
               if( _frames.size() >= 2 )
               {
                  frame& parent = _frames[_frames.size()-2];
                  for( auto& item : top.undo )
                     parent.undo.insert( std::move(item) );
               }
            }
            else
            {
               for( auto& item : top.undo )
               {
                  if( item.second.had_write )
                     _writes[item.first] = std::move(item.second.previous);
                  else
                     _writes.erase(item.first);
               }
            }
            _frames.pop_back();
         }

         virtual account_id_type active_account()const override
         {
            FC_ASSERT( !_frames.empty(), "no active frame" );
            return _frames.back().account;
         }

         virtual void rollback() override
         {
            FC_ASSERT( !_finished );
            _writes.clear();
            _frames.clear();
            _finished = true;
         }

         virtual kv_store& manager_state() override { return _manager; }
         virtual kv_store& account_state() override { return _account; }

         optional<bytes> read( const state_key& key )const
         {
            auto itr = _writes.find(key);
            if( itr != _writes.end() )
               return itr->second;
            auto committed = _snapshot->find(key);
            if( committed != _snapshot->end() )
               return committed->second;
            return optional<bytes>();
         }

         /** a write of an empty optional removes the key */
         void write( const state_key& key, optional<bytes> value )
         {
            FC_ASSERT( !_finished );
            if( !_frames.empty() )
            {
               auto& undo = _frames.back().undo;
               if( undo.find(key) == undo.end() )
               {
                  auto itr = _writes.find(key);
                  undo_entry entry;
                  entry.had_write = itr != _writes.end();
                  if( entry.had_write )
                     entry.previous = itr->second;
                  undo.emplace( key, std::move(entry) );
               }
            }
            _writes[key] = std::move(value);
         }

         /** marks the transaction finished and hands out its writes */
         std::map<state_key, optional<bytes>> finish()
         {
            FC_ASSERT( !_finished );
            _finished = true;
            _frames.clear();
            return std::move(_writes);
         }

      private:
         struct undo_entry
         {
            undo_entry():had_write(false){}

            bool            had_write;
            optional<bytes> previous;
         };

         struct frame
         {
            frame( account_id_type a, bool v ):account(a),is_volatile(v){}

            account_id_type                  account;
            bool                             is_volatile;
            std::map<state_key, undo_entry>  undo;
         };

         shared_ptr<const state_map>            _snapshot;
         std::map<state_key, optional<bytes>>   _writes;
         std::deque<frame>                      _frames;
         bool                                   _finished = false;
         space_store                            _manager;
         space_store                            _account;
   };

   state_key space_store::make_key( const bytes& key )const
   {
      uint64_t account = 0;
      if( _space != manager_space )
         account = _trx.active_account().get();
      return state_key( _space, account, key );
   }

   optional<bytes> space_store::get( const bytes& key )const
   {
      return _trx.read( make_key(key) );
   }

   void space_store::set( const bytes& key, const bytes& value )
   {
      _trx.write( make_key(key), value );
   }

   void space_store::remove( const bytes& key )
   {
      _trx.write( make_key(key), optional<bytes>() );
   }

} // detail

   memory_state::memory_state()
   :_committed( std::make_shared<state_map>() ){}

   unique_ptr<transaction> memory_state::new_transaction()
   {
      std::lock_guard<std::mutex> lock(_mutex);
      return unique_ptr<transaction>( new detail::memory_transaction(_committed) );
   }

   void memory_state::commit( unique_ptr<transaction> trx )
   {
      auto* mtrx = dynamic_cast<detail::memory_transaction*>( trx.get() );
      FC_ASSERT( mtrx != nullptr, "transaction was not opened by this state handler" );
      auto writes = mtrx->finish();

      std::lock_guard<std::mutex> lock(_mutex);
      auto next = std::make_shared<state_map>( *_committed );
      for( auto& item : writes )
      {
         if( item.second.valid() )
            (*next)[item.first] = std::move(*item.second);
         else
            next->erase(item.first);
      }
      _committed = next;
      dlog( "committed ${n} writes", ("n", writes.size()) );
   }

   optional<bytes> memory_state::find( const state_key& key )const
   {
      shared_ptr<const state_map> committed;
      {
         std::lock_guard<std::mutex> lock(_mutex);
         committed = _committed;
      }
      auto itr = committed->find(key);
      if( itr == committed->end() )
         return optional<bytes>();
      return itr->second;
   }

   optional<bytes> memory_state::get( account_id_type account, const bytes& key )const
   {
      return find( state_key( account_data_space, account.get(), key ) );
   }

   optional<bytes> memory_state::get_manager( const bytes& key )const
   {
      return find( state_key( manager_space, 0, key ) );
   }

   optional<bytes> memory_state::storage_params( account_id_type account )const
   {
      return find( state_key( account_params_space, account.get(), bytes() ) );
   }

   bool memory_state::account_exists( account_id_type account )const
   {
      return storage_params(account).valid();
   }

} } // ixc::db
