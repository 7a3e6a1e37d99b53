#include <folio.ledger/folio.ledger.hpp>

#include <utils.hpp>

namespace folio {
using namespace std;

void folio_ledger::propose(const name& proposer, const string& description, const uint32_t& voting_period) {
   require_auth( proposer );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( description.size() > 0 && description.size() <= MAX_DESCRIPTION_SIZE, err::INVALID_ARGUMENT, "invalid description size" )
   CHECKC( voting_period > 0, err::INVALID_ARGUMENT, "voting period must be positive" )

   auto now       = time_point_sec( current_time_point() );
   auto deadline  = now + voting_period;
   auto id        = ++_gstate.proposal_id;

   proposal_t::tbl_t proposals(_self, _self.value);
   proposals.emplace(_self, [&](auto& row) {
      row.id               = id;
      row.proposer         = proposer;
      row.description      = description;
      row.created_at       = now;
      row.voting_deadline  = deadline;
   });

   EMIT( proposallog_action, id, proposer, deadline )
}

//the voting weight is taken as given, it is not backed by any balance
void folio_ledger::vote(const name& voter, const uint64_t& proposal_id, const uint64_t& votes) {
   require_auth( voter );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )

   proposal_t::tbl_t proposals(_self, _self.value);
   auto itr = proposals.find(proposal_id);
   CHECKC( itr != proposals.end(), err::INVALID_ARGUMENT, "proposal not found: " + to_string(proposal_id) )
   CHECKC( time_point_sec(current_time_point()) < itr->voting_deadline, err::VOTING_CLOSED, "voting closed" )
   CHECKC( !itr->executed, err::ALREADY_EXECUTED, "proposal already executed" )
   CHECKC( votes > 0, err::INVALID_ARGUMENT, "votes must be positive" )

   proposals.modify(itr, same_payer, [&](auto& row) {
      row.vote_count += votes;
   });
   _gstate.total_votes += votes;

   EMIT( votelog_action, voter, proposal_id, votes )
}

} //namespace folio
