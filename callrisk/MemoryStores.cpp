#include "MemoryStores.h"
#include "Heuristics.h"

#include <algorithm>
#include <stdexcept>
#include <folly/Conv.h>
#include <folly/String.h>

using folly::StringPiece;

// Cap on results retained per entity
static constexpr size_t kMaxResultsPerEntity = 1000;

static std::string denylistKey(StringPiece identifier, StringPiece kind) {
  identifier = folly::trimWhitespace(identifier);
  std::string key = kind.str();
  key += '\t';

  if (kind == "phone") {
    uint64_t pn = PhoneNumber::fromString(identifier);
    if (pn != PhoneNumber::NONE) {
      key += folly::to<std::string>(pn);
      return key;
    }
  }

  size_t offset = key.size();
  key.append(identifier.data(), identifier.size());
  if (kind == "email")
    folly::toLowerAscii(&key[offset], key.size() - offset);
  return key;
}

DenylistMatch InMemoryDenylist::isDenylisted(StringPiece identifier, StringPiece kind) {
  DenylistMatch match;
  auto key = denylistKey(identifier, kind);
  auto locked = entries_.rlock();
  auto it = locked->find(key);
  if (it != locked->end()) {
    match.matched = true;
    match.reason = it->second;
  }
  return match;
}

void InMemoryDenylist::add(StringPiece identifier, StringPiece kind, StringPiece reason) {
  entries_.wlock()->insert_or_assign(denylistKey(identifier, kind), reason.str());
}

bool InMemoryDenylist::remove(StringPiece identifier, StringPiece kind) {
  return entries_.wlock()->erase(denylistKey(identifier, kind)) > 0;
}

size_t InMemoryDenylist::size() const {
  return entries_.rlock()->size();
}

void InMemoryDenylist::fromCSV(std::istream &in, size_t &line) {
  std::string linebuf;
  std::vector<StringPiece> row;

  while (in.peek() != EOF) {
    row.clear();
    std::getline(in, linebuf);
    ++line;
    if (folly::trimWhitespace(linebuf).empty())
      continue;

    folly::split(',', linebuf, row);
    if (row.size() < 2 || row.size() > 3)
      throw std::runtime_error("bad number of columns");
    if (folly::trimWhitespace(row[0]).empty())
      throw std::runtime_error("empty identifier");

    StringPiece reason = row.size() == 3 ? folly::trimWhitespace(row[2]) : StringPiece("denylisted");
    add(row[0], folly::trimWhitespace(row[1]), reason);
  }
}

// Full sweep of velocity windows every this many recorded actions
static constexpr uint64_t kVelocitySweepInterval = 4096;

SlidingWindowVelocity::SlidingWindowVelocity(std::shared_ptr<const LiveRules> rules,
                                             ClockFn clock)
  : rules_(std::move(rules))
  , clock_(std::move(clock))
{
}

static std::shared_ptr<const LiveRules> fixedLimits(std::map<std::string, VelocityLimit> limits) {
  FraudRules rules = FraudRules::defaults();
  rules.velocityLimits = std::move(limits);
  return std::make_shared<const LiveRules>(std::move(rules));
}

SlidingWindowVelocity::SlidingWindowVelocity(std::map<std::string, VelocityLimit> limits,
                                             ClockFn clock)
  : SlidingWindowVelocity(fixedLimits(std::move(limits)), std::move(clock))
{
}

static const VelocityLimit* limitFor(const FraudRules &rules, StringPiece action) {
  auto it = rules.velocityLimits.find(action.str());
  return it == rules.velocityLimits.end() ? nullptr : &it->second;
}

static std::string windowKey(StringPiece entityId, StringPiece action) {
  return folly::to<std::string>(action, '\t', entityId);
}

static void expire(std::deque<SystemTimePoint> &hits, SystemTimePoint horizon) {
  while (!hits.empty() && hits.front() <= horizon)
    hits.pop_front();
}

VelocityResult SlidingWindowVelocity::checkVelocity(StringPiece entityId, StringPiece action) {
  VelocityResult result;
  auto rules = rules_->current();
  const VelocityLimit *limit = limitFor(*rules, action);
  if (!limit)
    return result;

  result.limit = limit->maxCount;
  result.window = limit->window;

  const SystemTimePoint horizon = clock_() - limit->window;
  auto locked = windows_.wlock();
  auto it = locked->find(windowKey(entityId, action));
  if (it != locked->end()) {
    expire(it->second.hits, horizon);
    result.count = static_cast<int64_t>(it->second.hits.size());
    if (it->second.hits.empty())
      locked->erase(it);
  }
  result.passed = result.count < limit->maxCount;
  return result;
}

void SlidingWindowVelocity::recordAction(StringPiece entityId, StringPiece action) {
  auto rules = rules_->current();
  const VelocityLimit *limit = limitFor(*rules, action);
  if (!limit)
    return;

  const SystemTimePoint now = clock_();
  auto locked = windows_.wlock();
  Window &window = (*locked)[windowKey(entityId, action)];
  if (window.action.empty())
    window.action = action.str();
  expire(window.hits, now - limit->window);
  window.hits.push_back(now);

  if (++recorded_ % kVelocitySweepInterval == 0)
    sweep(*locked, *rules, now);
}

size_t SlidingWindowVelocity::sweep(WindowMap &windows, const FraudRules &rules,
                                    SystemTimePoint now)
{
  size_t dropped = 0;
  for (auto it = windows.begin(); it != windows.end();) {
    const VelocityLimit *limit = limitFor(rules, it->second.action);
    if (limit)
      expire(it->second.hits, now - limit->window);
    if (!limit || it->second.hits.empty()) {
      it = windows.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  return dropped;
}

size_t SlidingWindowVelocity::sweep() {
  auto rules = rules_->current();
  return sweep(*windows_.wlock(), *rules, clock_());
}

size_t SlidingWindowVelocity::size() const {
  return windows_.rlock()->size();
}

void InMemoryFraudStore::saveCheckResult(const FraudCheckResult &result) {
  auto locked = state_.wlock();
  auto &results = locked->results[result.entityId];
  results.push_back(result);
  if (results.size() > kMaxResultsPerEntity)
    results.pop_front();
}

std::vector<FraudCheckResult>
InMemoryFraudStore::getCheckHistory(StringPiece entityId, size_t limit) {
  std::vector<FraudCheckResult> out;
  auto locked = state_.rlock();
  auto it = locked->results.find(entityId.str());
  if (it == locked->results.end())
    return out;

  const auto &results = it->second;
  for (auto r = results.rbegin(); r != results.rend() && out.size() < limit; ++r)
    out.push_back(*r);
  return out;
}

void InMemoryFraudStore::saveFraudReport(const FraudReport &report) {
  state_.wlock()->reports.push_back(report);
}

folly::Optional<RiskProfile> InMemoryFraudStore::getRiskProfile(StringPiece entityId) {
  auto locked = state_.rlock();
  auto it = locked->profiles.find(entityId.str());
  if (it == locked->profiles.end())
    return folly::none;
  return it->second;
}

void InMemoryFraudStore::saveRiskProfile(const RiskProfile &profile) {
  state_.wlock()->profiles.insert_or_assign(profile.entityId, profile);
}

std::vector<FraudReport> InMemoryFraudStore::reports() const {
  return state_.rlock()->reports;
}
