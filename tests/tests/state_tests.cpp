#include <boost/test/unit_test.hpp>

#include <ixc/db/memory_state.hpp>

using namespace ixc::db;
using namespace ixc::message;

namespace {
   bytes b( const string& s ) { return bytes( s.begin(), s.end() ); }
   const account_id_type alice( 70000 );
   const account_id_type bob( 70001 );
}

BOOST_AUTO_TEST_SUITE( state_tests )

BOOST_AUTO_TEST_CASE( pop_without_frames )
{
   memory_state state;
   auto trx = state.new_transaction();
   BOOST_CHECK_THROW( trx->pop_frame( true ), no_frames_exception );
   BOOST_CHECK_THROW( trx->pop_frame( false ), no_frames_exception );

   trx->push_frame( alice, false );
   trx->pop_frame( true );
   BOOST_CHECK_THROW( trx->pop_frame( true ), no_frames_exception );
}

BOOST_AUTO_TEST_CASE( volatile_frames_nest )
{
   memory_state state;
   auto trx = state.new_transaction();
   trx->push_frame( alice, false );
   trx->push_frame( bob, true );
   trx->push_frame( alice, true );
   BOOST_CHECK( trx->active_account() == alice );
}

BOOST_AUTO_TEST_CASE( failed_push_leaves_stack_unchanged )
{
   memory_state state;
   auto trx = state.new_transaction();
   trx->push_frame( alice, false );
   trx->push_frame( bob, true );

   BOOST_CHECK_THROW( trx->push_frame( alice, false ), volatile_access_exception );
   BOOST_CHECK( trx->active_account() == bob );

   trx->pop_frame( true );
   BOOST_CHECK( trx->active_account() == alice );
   trx->pop_frame( true );
   BOOST_CHECK_THROW( trx->pop_frame( true ), no_frames_exception );
}

BOOST_AUTO_TEST_CASE( account_state_follows_the_active_frame )
{
   memory_state state;
   auto trx = state.new_transaction();
   trx->push_frame( alice, false );
   trx->account_state().set( b("k"), b("alice") );
   trx->push_frame( bob, false );
   BOOST_CHECK( !trx->account_state().get( b("k") ) );
   trx->account_state().set( b("k"), b("bob") );
   trx->pop_frame( true );
   BOOST_CHECK( *trx->account_state().get( b("k") ) == b("alice") );
   state.commit( std::move(trx) );

   BOOST_CHECK( *state.get( alice, b("k") ) == b("alice") );
   BOOST_CHECK( *state.get( bob, b("k") ) == b("bob") );
   BOOST_CHECK( !state.get_manager( b("k") ) );
}

BOOST_AUTO_TEST_CASE( rolled_back_frame_restores_writes )
{
   memory_state state;
   {
      auto trx = state.new_transaction();
      trx->push_frame( alice, false );
      trx->account_state().set( b("kept"), b("1") );
      trx->account_state().set( b("removed"), b("1") );
      state.commit( std::move(trx) );
   }

   auto trx = state.new_transaction();
   trx->push_frame( alice, false );
   trx->account_state().set( b("kept"), b("2") );

   trx->push_frame( alice, false );
   trx->account_state().set( b("kept"), b("3") );
   trx->account_state().remove( b("removed") );
   trx->account_state().set( b("new"), b("3") );
   trx->manager_state().set( b("bookkeeping"), b("3") );
   trx->init_account_storage( bob, b("params") );
   trx->pop_frame( false );

   BOOST_CHECK( *trx->account_state().get( b("kept") ) == b("2") );
   BOOST_CHECK( *trx->account_state().get( b("removed") ) == b("1") );
   BOOST_CHECK( !trx->account_state().get( b("new") ) );
   BOOST_CHECK( !trx->manager_state().get( b("bookkeeping") ) );
   state.commit( std::move(trx) );

   BOOST_CHECK( *state.get( alice, b("kept") ) == b("2") );
   BOOST_CHECK( !state.account_exists( bob ) );
}

BOOST_AUTO_TEST_CASE( committed_frame_is_undone_by_its_parent )
{
   memory_state state;
   auto trx = state.new_transaction();
   trx->push_frame( alice, false );
   trx->account_state().set( b("k"), b("outer") );

   trx->push_frame( alice, false );
   trx->push_frame( alice, false );
   trx->account_state().set( b("k"), b("inner") );
   trx->account_state().set( b("other"), b("inner") );
   trx->pop_frame( true );
   BOOST_CHECK( *trx->account_state().get( b("k") ) == b("inner") );
   trx->pop_frame( false );

   BOOST_CHECK( *trx->account_state().get( b("k") ) == b("outer") );
   BOOST_CHECK( !trx->account_state().get( b("other") ) );
}

BOOST_AUTO_TEST_CASE( rollback_discards_everything )
{
   memory_state state;
   auto trx = state.new_transaction();
   trx->push_frame( alice, false );
   trx->account_state().set( b("k"), b("v") );
   trx->manager_state().set( b("m"), b("v") );
   trx->init_account_storage( alice, b("params") );
   trx->rollback();

   BOOST_CHECK_THROW( trx->rollback(), fc::exception );
   BOOST_CHECK_THROW( state.commit( std::move(trx) ), fc::exception );
   BOOST_CHECK( !state.get( alice, b("k") ) );
   BOOST_CHECK( !state.get_manager( b("m") ) );
   BOOST_CHECK( !state.account_exists( alice ) );
}

BOOST_AUTO_TEST_CASE( transactions_read_their_snapshot )
{
   memory_state state;
   auto first  = state.new_transaction();
   auto second = state.new_transaction();

   first->manager_state().set( b("m"), b("first") );
   BOOST_CHECK( !second->manager_state().get( b("m") ) );
   state.commit( std::move(first) );

   BOOST_CHECK( !second->manager_state().get( b("m") ) );
   BOOST_CHECK( *state.get_manager( b("m") ) == b("first") );

   auto third = state.new_transaction();
   BOOST_CHECK( *third->manager_state().get( b("m") ) == b("first") );
   third->manager_state().remove( b("m") );
   state.commit( std::move(third) );
   BOOST_CHECK( !state.get_manager( b("m") ) );
}

BOOST_AUTO_TEST_CASE( storage_params_are_recorded )
{
   memory_state state;
   auto trx = state.new_transaction();
   trx->init_account_storage( alice, b("params") );
   trx->init_account_storage( bob, bytes() );
   state.commit( std::move(trx) );

   BOOST_CHECK( *state.storage_params( alice ) == b("params") );
   BOOST_CHECK( state.account_exists( bob ) );
   BOOST_CHECK( state.storage_params( bob )->empty() );
   BOOST_CHECK( !state.account_exists( account_id_type( 70002 ) ) );
}

BOOST_AUTO_TEST_SUITE_END()
