/*───────────────────────────────────────────────────────────
 *  common.hpp   –  log / progress / text helpers
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace taxi_fare {

/* ────────────────── log / 进度 ────────────────── */
void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

void progress(const std::string& tag,
              size_t cur, size_t tot, size_t barWidth = 40);

/* ────────────────── 文本 / 数值小工具 ────────────────── */
std::string trim(const std::string& s);

/* split on `sep`, keeping empty fields ("a,,b," -> 4 fields) */
std::vector<std::string> split_fields(const std::string& line, char sep = ',');

/* shortest plain decimal text that reads back to exactly `v` */
std::string format_number(double v);

/*  .NET-style custom numeric format with optional digits:
 *    format_optional_decimals(0.5, 2, true)  -> "0.5"   ("0.##")
 *    format_optional_decimals(0.5, 2, false) -> ".5"    ("#.##")   */
std::string format_optional_decimals(double v, int decimals, bool leading_zero);

} // namespace taxi_fare
