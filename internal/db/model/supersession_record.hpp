#pragma once

#include <cstdint>
#include <string>

namespace ragctx::db::model {

/*
  One "supersedes" edge.

  document_id ---supersedes---> superseded_document_id

  A document has at most one outgoing edge (document_id is the key).
  superseded_document_id is empty while superseded_path has not been
  indexed yet; it is filled in once that path shows up.
*/

struct SupersessionRecord {
  std::string document_id;
  std::string tenant_key;

  std::string superseded_path;
  std::string superseded_document_id;

  uint64_t created_at_ms = 0;

  bool IsResolved() const {
    return !superseded_document_id.empty();
  }
};

} // namespace ragctx::db::model
