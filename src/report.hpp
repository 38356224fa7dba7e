#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "audits.hpp"

// Value of `row` under a heading key ("url", "group", "start", "self", "duration", "end").
std::string table_cell(const AttributedRow& row, const TableHeading& heading);

// Title, summary and an aligned table of the heading columns.
std::string render_text(const AuditResult& result);

// { id, title, description, score, scoreDisplayMode, displayValue?, notApplicable,
//   details: { type: "table", headings, items } }
nlohmann::json result_to_json(const AuditResult& result);
