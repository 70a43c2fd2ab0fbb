#pragma once

namespace coolrouter::db::sql {

/*
  Canonical request SQL, SQLite placeholder style.
  The postgres pool prepares $n equivalents of the same statements.
*/

static constexpr const char* INSERT_REQUEST =
    "INSERT INTO llm_request(id,requesting_party,provider,model_id,status,created_at_ms,"
    "min_votes,approval_threshold,winning_hash,total_votes_cast,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,1);";

static constexpr const char* SELECT_REQUEST =
    "SELECT id,requesting_party,provider,model_id,status,created_at_ms,"
    "min_votes,approval_threshold,winning_hash,total_votes_cast,version"
    " FROM llm_request WHERE id=?;";

// ?1 status or NULL for any, ?2 row limit or -1 for all.
static constexpr const char* SELECT_REQUEST_IDS =
    "SELECT id FROM llm_request WHERE (?1 IS NULL OR status=?1)"
    " ORDER BY created_at_ms, id LIMIT ?2;";

static constexpr const char* SELECT_REQUEST_VERSION =
    "SELECT version FROM llm_request WHERE id=?;";

static constexpr const char* UPDATE_REQUEST =
    "UPDATE llm_request SET status=?,winning_hash=?,total_votes_cast=?,version=version+1"
    " WHERE id=? AND version=?;";

// callback targets

static constexpr const char* INSERT_CALLBACK_TARGET =
    "INSERT INTO llm_request_callback_target(request_id,position,pubkey,is_writable)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_CALLBACK_TARGETS =
    "SELECT pubkey,is_writable FROM llm_request_callback_target"
    " WHERE request_id=? ORDER BY position;";

// votes

static constexpr const char* INSERT_VOTE =
    "INSERT INTO llm_request_vote(request_id,position,oracle,result_hash)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_VOTES =
    "SELECT oracle,result_hash FROM llm_request_vote"
    " WHERE request_id=? ORDER BY position;";

}
