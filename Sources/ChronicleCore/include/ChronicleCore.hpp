#pragma once

// ChronicleCore - field-level change auditing on SQLite
//
// Usage:
//   #include <ChronicleCore.hpp>
//
//   struct Customer {
//       int64_t id;
//       std::string name;
//       std::optional<std::string> email;
//   };
//   CHRONICLE_RECORD(Customer, id, name, email);
//
//   int main() {
//       chronicle::auditor audit;  // in-memory, or auditor(configuration("audit.db"))
//       audit.track<Customer>({"name", "email"});
//
//       chronicle::context_stack ctx;
//       chronicle::scoped_context as_admin(ctx, {"admin", "initial import", std::nullopt});
//
//       audit.write(ctx, [&](chronicle::audit_session& s) {
//           s.stage(chronicle::record_change<Customer>::created({1, "John", "a@x.com"}));
//       });
//
//       chronicle::change_filter filter;
//       filter.resource_ids = {"1"};
//       for (const auto& change : audit.query<Customer>(filter)) {
//           std::cout << change.to_json().dump() << std::endl;
//       }
//   }

#include "chronicle/types.hpp"
#include "chronicle/errors.hpp"
#include "chronicle/log.hpp"
#include "chronicle/type_registry.hpp"
#include "chronicle/schema.hpp"
#include "chronicle/context.hpp"
#include "chronicle/dirty_record.hpp"
#include "chronicle/diff_engine.hpp"
#include "chronicle/db.hpp"
#include "chronicle/audit_writer.hpp"
#include "chronicle/retriever.hpp"
#include "chronicle/auditor.hpp"
