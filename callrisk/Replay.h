#ifndef CALLRISK_REPLAY_H
#define CALLRISK_REPLAY_H

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace folly { struct dynamic; }

class FraudDetector;
class InMemoryDenylist;
struct FraudRules;

/** Load a JSON rules file. Logs `file: message` and returns nullptr on failure. */
std::unique_ptr<FraudRules> loadRulesFile(const std::string &path);

/** Load a denylist CSV into `denylist`. Logs `file:line: message` on failure. */
bool loadDenylistFile(const std::string &path, InMemoryDenylist &denylist);

/*
 * Feeds JSON events through a FraudDetector. Each event is an object
 * with a "type" of call, bid (with its "buyer" account), account,
 * report, score or rules; the answer is one JSON object per event.
 */
class EventReplayer {
 public:
  explicit EventReplayer(FraudDetector &detector);

  folly::dynamic handle(const folly::dynamic &event);

  /** Replay JSON lines from `in` to `out`. Returns number of failed events. */
  size_t replay(std::istream &in, std::ostream &out);

 private:
  FraudDetector &detector_;
};

#endif // CALLRISK_REPLAY_H
