#include <clocale>
#include <fstream>
#include <iostream>
#include <memory>
#include <folly/init/Init.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>

#include "AuditLog.h"
#include "FraudDetector.h"
#include "MemoryStores.h"
#include "Replay.h"

DEFINE_string(rules, "", "JSON file with fraud rules; built-in defaults when empty");
DEFINE_string(denylist, "", "CSV file with identifier,kind,reason rows");
DEFINE_string(events, "-", "JSON lines file with events to check ('-' for stdin)");
DEFINE_string(output, "-", "Where to write one JSON decision per event ('-' for stdout)");
DEFINE_string(audit_log, "", "Append check results and fraud reports to this file");

int main(int argc, char* argv[]) {
  folly::Init init(&argc, &argv);
  google::InstallFailureSignalHandler();
  setlocale(LC_ALL, "C");

  FraudRules rules = FraudRules::defaults();
  if (!FLAGS_rules.empty()) {
    auto loaded = loadRulesFile(FLAGS_rules);
    if (!loaded)
      return 1;
    rules = std::move(*loaded);
  }

  auto denylist = std::make_shared<InMemoryDenylist>();
  if (!FLAGS_denylist.empty() && !loadDenylistFile(FLAGS_denylist, *denylist))
    return 1;

  auto liveRules = std::make_shared<LiveRules>(std::move(rules));
  auto store = std::make_shared<InMemoryFraudStore>();
  FraudCollaborators collaborators;
  collaborators.denylist = denylist;
  collaborators.velocity = std::make_shared<SlidingWindowVelocity>(liveRules);
  collaborators.results = std::make_shared<AuditLogStore>(store, FLAGS_audit_log);
  collaborators.profiles = store;
  FraudDetector detector(std::move(collaborators), liveRules);

  std::ifstream eventsFile;
  std::istream *in = &std::cin;
  if (FLAGS_events != "-") {
    eventsFile.open(FLAGS_events);
    if (!eventsFile.is_open()) {
      LOG(ERROR) << "Could not open events file " << FLAGS_events;
      return 1;
    }
    in = &eventsFile;
  }

  std::ofstream outputFile;
  std::ostream *out = &std::cout;
  if (FLAGS_output != "-") {
    outputFile.open(FLAGS_output, std::ios_base::out | std::ios_base::trunc);
    if (!outputFile.is_open()) {
      LOG(ERROR) << "Could not open output file " << FLAGS_output;
      return 1;
    }
    out = &outputFile;
  }

  LOG(INFO) << "Replaying events";
  EventReplayer replayer(detector);
  size_t failed = replayer.replay(*in, *out);
  out->flush();

  LOG_IF(WARNING, detector.auditFailures() != 0)
    << detector.auditFailures() << " check results were not persisted";
  return failed == 0 ? 0 : 2;
}
