// 표준 라이브러리
#include <map>
#include <ranges>
#include <unordered_map>

// 파일 헤더
#include "Engines/Category.hpp"

namespace technical_analysis::category {

namespace {

using CategoryTable = map<string, vector<string>>;

const CategoryTable& GetCategoryTable() {
  static const CategoryTable table = {
      {"candles", {"cdl_pattern", "cdl_z", "ha"}},
      {"cycles", {"ebsw", "reflex"}},
      {"momentum",
       {"ao",      "apo",   "bias",  "bop",         "brar",     "cci",
        "cfo",     "cg",    "cmo",   "coppock",     "crsi",     "cti",
        "er",      "eri",   "exhc",  "fisher",      "inertia",  "kdj",
        "kst",     "macd",  "mom",   "pgo",         "ppo",      "psl",
        "qqe",     "roc",   "rsi",   "rsx",         "rvgi",     "slope",
        "smc",     "smi",   "squeeze", "squeeze_pro", "stc",    "stoch",
        "stochf",  "stochrsi", "tmo", "trix",       "tsi",      "uo",
        "willr"}},
      {"overlap",
       {"alligator", "alma",     "dema",  "ema",      "fwma",     "hilo",
        "hl2",       "hlc3",     "hma",   "hwma",     "ichimoku", "jma",
        "kama",      "linreg",   "mama",  "mcgd",     "midpoint", "midprice",
        "ohlc4",     "pivots",   "pwma",  "rma",      "sinwma",   "sma",
        "smma",      "ssf",      "ssf3",  "supertrend", "swma",   "t3",
        "tema",      "trima",    "vidya", "wcp",      "wma",      "zlma"}},
      {"performance", {"log_return", "percent_return"}},
      {"statistics",
       {"entropy", "kurtosis", "mad", "median", "quantile", "skew", "stdev",
        "tos_stdevall", "variance", "zscore"}},
      {"transform", {"cube", "ifisher", "remap"}},
      {"trend",
       {"adx",       "alphatrend", "amat",         "aroon",      "chop",
        "cksp",      "decay",      "decreasing",   "dpo",        "ht_trendline",
        "increasing", "long_run",  "psar",         "qstick",     "rwi",
        "short_run", "trendflex",  "tsignals",     "vhf",        "vortex",
        "xsignals",  "zigzag"}},
      {"volatility",
       {"aberration", "accbands", "atr", "atrts", "bbands", "chandelier_exit",
        "donchian", "hwc", "kc", "massi", "natr", "pdist", "rvi", "thermo",
        "true_range", "ui"}},
      {"volume",
       {"ad", "adosc", "aobv", "cmf", "efi", "eom", "kvo", "mfi", "nvi", "obv",
        "pvi", "pvo", "pvol", "pvr", "pvt", "vhm", "vwap", "vwma",
        "wb_tsv"}}};

  return table;
}

// 지표 이름 → 분류 역방향 조회 테이블
const unordered_map<string, string>& GetReverseTable() {
  static const unordered_map<string, string> reverse_table = [] {
    unordered_map<string, string> result;
    for (const auto& [category, indicators] : GetCategoryTable()) {
      for (const auto& indicator : indicators) {
        result.emplace(indicator, category);
      }
    }

    return result;
  }();

  return reverse_table;
}

}  // namespace

optional<string> GetCategory(const string& indicator_name) {
  const auto& reverse_table = GetReverseTable();

  if (const auto it = reverse_table.find(indicator_name);
      it != reverse_table.end()) {
    return it->second;
  }

  return nullopt;
}

vector<string> GetIndicators(const string& category) {
  const auto& table = GetCategoryTable();

  if (const auto it = table.find(category); it != table.end()) {
    return it->second;
  }

  return {};
}

vector<string> GetCategories() {
  vector<string> categories;
  for (const auto& category : GetCategoryTable() | views::keys) {
    categories.push_back(category);
  }

  return categories;
}

}  // namespace technical_analysis::category
