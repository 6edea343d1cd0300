#include "gateway/stream_relay.h"

#include "gateway/openai_format.h"
#include "server/logging/logger.h"

#include <optional>

namespace modelgate {

namespace {

void MarkClientGone(RelayResult* result) {
  result->outcome = RelayOutcome::kClientGone;
  result->error = ErrorKind::kClientDisconnected;
  result->error_message = "Client disconnected";
}

}  // namespace

RelayResult StreamRelay::Run(ChunkStream& stream, EventSink& sink) const {
  RelayResult result;
  std::optional<int> prompt_tokens;
  std::optional<int> completion_tokens;
  int content_chunks = 0;
  bool first = true;

  while (true) {
    StreamItem item = stream.Next();

    if (item.kind == StreamItem::Kind::kError &&
        item.error == ErrorKind::kClientDisconnected) {
      MarkClientGone(&result);
      break;
    }

    if (!result.started) {
      if (item.kind == StreamItem::Kind::kError) {
        result.outcome = RelayOutcome::kUpstreamFailed;
        result.error = item.error;
        result.error_message = item.message;
        break;
      }
      if (!sink.BeginStream()) {
        stream.Cancel();
        MarkClientGone(&result);
        break;
      }
      result.started = true;
    }

    if (item.kind == StreamItem::Kind::kChunk) {
      if (!item.event.content.empty()) {
        ++content_chunks;
      }
      if (item.event.prompt_eval_count) {
        prompt_tokens = item.event.prompt_eval_count;
      }
      if (item.event.eval_count) {
        completion_tokens = item.event.eval_count;
      }
      std::string frame = SseFrame(renderer_(item.event, first));
      first = false;
      if (!sink.WriteFrame(frame)) {
        stream.Cancel();
        MarkClientGone(&result);
        break;
      }
      ++result.data_frames;
      continue;
    }

    if (item.kind == StreamItem::Kind::kEnd) {
      if (!sink.WriteFrame(kSseDoneFrame)) {
        MarkClientGone(&result);
        break;
      }
      result.outcome = RelayOutcome::kCompleted;
      break;
    }

    // Failure after the stream began: one terminal error frame, no [DONE].
    result.outcome = RelayOutcome::kUpstreamFailed;
    result.error = item.error;
    result.error_message = item.message;
    if (!sink.WriteFrame(SseFrame(BuildErrorBody(item.error, item.message)))) {
      log::Debug("relay", "client gone before error frame",
                 std::string("error=") + ErrorKindId(item.error));
    }
    break;
  }

  result.prompt_tokens = prompt_tokens.value_or(0);
  // Without final counts, fall back to the number of content chunks seen.
  result.completion_tokens = completion_tokens.value_or(content_chunks);
  return result;
}

}  // namespace modelgate
