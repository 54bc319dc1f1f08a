#include "market_session.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <vector>

namespace mdstream {
namespace engine {
namespace caching {

namespace {

struct Session {
  int start_minute;  // inclusive, exchange-local minute of day
  int end_minute;    // exclusive
  MarketStatus status;
};

const std::vector<Session>& SessionsFor(Market market) {
  static const std::vector<Session> kHongKong = {
      {9 * 60, 9 * 60 + 30, MarketStatus::kPreMarket},
      {9 * 60 + 30, 12 * 60, MarketStatus::kTrading},
      {12 * 60, 13 * 60, MarketStatus::kLunchBreak},
      {13 * 60, 16 * 60, MarketStatus::kTrading}};
  static const std::vector<Session> kMainland = {
      {9 * 60 + 15, 9 * 60 + 30, MarketStatus::kPreMarket},
      {9 * 60 + 30, 11 * 60 + 30, MarketStatus::kTrading},
      {11 * 60 + 30, 13 * 60, MarketStatus::kLunchBreak},
      {13 * 60, 15 * 60, MarketStatus::kTrading}};
  static const std::vector<Session> kUnitedStates = {
      {4 * 60, 9 * 60 + 30, MarketStatus::kPreMarket},
      {9 * 60 + 30, 16 * 60, MarketStatus::kTrading},
      {16 * 60, 20 * 60, MarketStatus::kAfterHours}};
  static const std::vector<Session> kNone;

  switch (market) {
    case Market::kHK: return kHongKong;
    case Market::kSZ:
    case Market::kSH:
    case Market::kCN: return kMainland;
    case Market::kUS: return kUnitedStates;
    default: return kNone;
  }
}

// 02:00 local on the switch days: 07:00 UTC in March (EST), 06:00 UTC in November (EDT)
bool IsUsDaylightSaving(common::WallClock::time_point at) {
  using namespace std::chrono;
  const auto utc_day = floor<days>(at);
  const year_month_day ymd{utc_day};
  const auto starts = sys_days{ymd.year() / March / Sunday[2]} + hours(7);
  const auto ends = sys_days{ymd.year() / November / Sunday[1]} + hours(6);
  return at >= starts && at < ends;
}

std::string FormatDate(const std::chrono::year_month_day& ymd) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buffer;
}

template <typename Predicate>
bool AllOf(const std::string& text, Predicate predicate) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [&predicate](char c) {
    return predicate(static_cast<unsigned char>(c)) != 0;
  });
}

int IsAlnum(unsigned char c) { return std::isalnum(c); }
int IsAlpha(unsigned char c) { return std::isalpha(c); }
int IsDigit(unsigned char c) { return std::isdigit(c); }

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() > suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

const char* ToString(Market market) {
  switch (market) {
    case Market::kHK: return "HK";
    case Market::kUS: return "US";
    case Market::kSZ: return "SZ";
    case Market::kSH: return "SH";
    case Market::kCN: return "CN";
    case Market::kCrypto: return "CRYPTO";
    case Market::kUnknown: return "UNKNOWN";
  }
  return "UNKNOWN";
}

const char* ToString(MarketStatus status) {
  switch (status) {
    case MarketStatus::kMarketClosed: return "MARKET_CLOSED";
    case MarketStatus::kPreMarket: return "PRE_MARKET";
    case MarketStatus::kTrading: return "TRADING";
    case MarketStatus::kLunchBreak: return "LUNCH_BREAK";
    case MarketStatus::kAfterHours: return "AFTER_HOURS";
    case MarketStatus::kHoliday: return "HOLIDAY";
    case MarketStatus::kWeekend: return "WEEKEND";
  }
  return "MARKET_CLOSED";
}

Market ParseMarket(const std::string& name) {
  static const Market kAll[] = {Market::kHK, Market::kUS, Market::kSZ,
                                Market::kSH, Market::kCN, Market::kCrypto};
  for (Market market : kAll) {
    if (name == ToString(market)) {
      return market;
    }
  }
  return Market::kUnknown;
}

MarketSessionCalendar::MarketSessionCalendar(common::WallTimeSource wall_time_source)
    : wall_time_source_(std::move(wall_time_source)) {}

void MarketSessionCalendar::LoadFromConfig(const common::ConfigManager& config) {
  size_t loaded = 0;
  for (const auto& name : config.GetObjectKeys("market_session.holidays")) {
    const Market market = ParseMarket(name);
    if (market == Market::kUnknown) {
      SPDLOG_WARN("MarketSessionCalendar: ignoring holidays for unknown market {}", name);
      continue;
    }
    for (const auto& date : config.GetStringArray("market_session.holidays." + name)) {
      AddHoliday(market, date);
      ++loaded;
    }
  }
  SPDLOG_INFO("MarketSessionCalendar: loaded {} holidays", loaded);
}

void MarketSessionCalendar::AddHoliday(Market market, const std::string& local_date) {
  std::lock_guard<std::mutex> lock(mutex_);
  holidays_[market].insert(local_date);
}

bool MarketSessionCalendar::IsHoliday(Market market, const std::string& local_date) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = holidays_.find(market);
  return it != holidays_.end() && it->second.count(local_date) > 0;
}

int MarketSessionCalendar::UtcOffsetMinutes(Market market, common::WallClock::time_point at) {
  switch (market) {
    case Market::kHK:
    case Market::kSZ:
    case Market::kSH:
    case Market::kCN:
      return 8 * 60;
    case Market::kUS:
      return IsUsDaylightSaving(at) ? -4 * 60 : -5 * 60;
    default:
      return 0;
  }
}

MarketStatus MarketSessionCalendar::GetStatus(Market market, common::WallClock::time_point at) const {
  using namespace std::chrono;
  if (market == Market::kCrypto) {
    return MarketStatus::kTrading;
  }
  if (market == Market::kUnknown) {
    return MarketStatus::kMarketClosed;
  }

  const auto local = at + minutes(UtcOffsetMinutes(market, at));
  const auto local_day = floor<days>(local);
  const weekday day_of_week{local_day};
  if (day_of_week == Saturday || day_of_week == Sunday) {
    return MarketStatus::kWeekend;
  }
  if (IsHoliday(market, FormatDate(year_month_day{local_day}))) {
    return MarketStatus::kHoliday;
  }

  const int minute_of_day = static_cast<int>(duration_cast<minutes>(local - local_day).count());
  for (const auto& session : SessionsFor(market)) {
    if (minute_of_day >= session.start_minute && minute_of_day < session.end_minute) {
      return session.status;
    }
  }
  return MarketStatus::kMarketClosed;
}

MarketStatus MarketSessionCalendar::GetCurrentStatus(Market market) const {
  return GetStatus(market, wall_time_source_());
}

Market MarketSessionCalendar::InferMarket(const std::string& symbol) {
  std::string upper = symbol;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (EndsWith(upper, ".HK")) return Market::kHK;
  if (EndsWith(upper, ".SZ")) return Market::kSZ;
  if (EndsWith(upper, ".SH")) return Market::kSH;
  if (EndsWith(upper, ".US")) return Market::kUS;
  if (EndsWith(upper, "USDT") && AllOf(upper, IsAlnum)) return Market::kCrypto;
  if (upper.size() <= 5 && AllOf(upper, IsAlpha)) return Market::kUS;
  if (AllOf(upper, IsDigit)) {
    if (upper.size() == 6) {
      return upper[0] == '6' ? Market::kSH : Market::kSZ;
    }
    if (upper.size() <= 5) {
      return Market::kHK;
    }
  }
  return Market::kUnknown;
}

}  // namespace caching
}  // namespace engine
}  // namespace mdstream
