#include "stream_json/event_parser.hpp"
#include "stream_json/number_parse.hpp"
#include "stream_json/path_builder.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace sj {

std::string_view to_string(EventKind k) noexcept {
  switch (k) {
    case EventKind::BeginObject: return "BeginObject";
    case EventKind::EndObject:   return "EndObject";
    case EventKind::BeginArray:  return "BeginArray";
    case EventKind::EndArray:    return "EndArray";
    case EventKind::ObjectKey:   return "ObjectKey";
    case EventKind::StringValue: return "StringValue";
    case EventKind::NumberValue: return "NumberValue";
    case EventKind::BoolValue:   return "BoolValue";
    case EventKind::NullValue:   return "NullValue";
  }
  return "?";
}

namespace {

enum class FrameKind { InObject, InArray, AfterKey };

// What the frame accepts next.
enum class Expect { KeyOrEnd, Key, Colon, Value, ValueOrEnd, CommaOrEnd };

struct Frame {
  FrameKind kind;
  Expect expect;
  std::uint64_t index;    // next element index (InArray)
  std::size_t path_mark;  // path length at this frame's own location
};

// Bookkeeping deferred to the next call so the last event's path stays intact.
enum class Pending { None, ValueDone, ContainerDone };

}

struct EventParser::Impl {
  Config cfg;
  Lexer lexer;
  PathBuilder path;
  std::vector<Frame> stack;
  std::size_t containers{0};
  Pending pending{Pending::None};
  bool root_done{false};
  bool ended{false};
  bool resting{false};  // EndOfDocument reported at a chunk boundary
  bool failed{false};
  Error err;

  explicit Impl(const Config& c)
    : cfg(c), lexer(c.lexer), path(c.max_path_bytes) {
    stack.reserve(std::min<std::size_t>(2 * cfg.max_depth + 1, 1024));
  }

  void reset() {
    lexer.reset();
    path.reset();
    stack.clear();
    containers = 0;
    pending = Pending::None;
    root_done = ended = resting = failed = false;
    err = Error{};
  }

  bool fail(ErrorCode code, std::uint64_t at, std::string msg, Status& st) {
    failed = true;
    err.code = code;
    err.offset = at;
    err.path.assign(path.view().data(), path.view().size());
    err.message = std::move(msg);
    st = Status::Error;
    return true;
  }

  bool unexpected(const Token& tok, Status& st) {
    return fail(ErrorCode::UnexpectedToken, tok.offset,
                "unexpected " + std::string(to_string(tok.kind)), st);
  }

  bool unbalanced(const Token& tok, Status& st) {
    return fail(ErrorCode::UnbalancedClose, tok.offset,
                "'" + std::string(to_string(tok.kind)) + "' does not match an open container", st);
  }

  void emit(Event& out, EventKind kind, const Token& tok) {
    out.kind = kind;
    out.text = tok.text;
    out.path = path.view();
    out.offset = tok.offset;
    out.depth = containers;
  }

  // Leave the location of a finished value: drop the key frame or the
  // array index segment.
  void close_value() {
    if (stack.empty()) { root_done = true; return; }
    Frame& top = stack.back();
    if (top.kind == FrameKind::AfterKey) {
      path.truncate(top.path_mark);
      stack.pop_back();
    } else if (top.kind == FrameKind::InArray) {
      path.truncate(top.path_mark);
    }
  }

  void apply_pending() {
    const Pending p = pending;
    pending = Pending::None;
    if (p == Pending::None) return;
    if (p == Pending::ContainerDone) {
      stack.pop_back();
      --containers;
    }
    close_value();
  }

  // Value token in value position; its path segment is already in place.
  bool begin_value(const Token& tok, Event& out, Status& st) {
    switch (tok.kind) {
      case TokenKind::OpenObject:
      case TokenKind::OpenArray: {
        if (containers >= cfg.max_depth) {
          return fail(ErrorCode::CapacityExceeded, tok.offset, "nesting deeper than max_depth", st);
        }
        const bool obj = tok.kind == TokenKind::OpenObject;
        stack.push_back(Frame{obj ? FrameKind::InObject : FrameKind::InArray,
                              obj ? Expect::KeyOrEnd : Expect::ValueOrEnd,
                              0, path.size()});
        ++containers;
        emit(out, obj ? EventKind::BeginObject : EventKind::BeginArray, tok);
        st = Status::Ok;
        return true;
      }
      case TokenKind::StringLiteral:
        emit(out, EventKind::StringValue, tok);
        break;
      case TokenKind::NumberLiteral:
        if (cfg.check_numbers && !is_json_number(tok.text)) {
          return fail(ErrorCode::InvalidNumber, tok.offset,
                      "malformed number '" + std::string(tok.text) + "'", st);
        }
        emit(out, EventKind::NumberValue, tok);
        break;
      case TokenKind::TrueLiteral:
      case TokenKind::FalseLiteral:
        emit(out, EventKind::BoolValue, tok);
        break;
      case TokenKind::NullLiteral:
        emit(out, EventKind::NullValue, tok);
        break;
      default:
        return unexpected(tok, st);
    }
    if (stack.empty()) root_done = true;
    else pending = Pending::ValueDone;
    st = Status::Ok;
    return true;
  }

  bool end_container(EventKind kind, const Token& tok, Event& out, Status& st) {
    emit(out, kind, tok);
    pending = Pending::ContainerDone;
    if (stack.size() == 1) root_done = true;
    st = Status::Ok;
    return true;
  }

  // Returns true when an event was produced or the parse failed.
  bool dispatch(const Token& tok, Event& out, Status& st) {
    if (stack.empty()) {
      if (tok.is_value_start()) return begin_value(tok, out, st);
      if (tok.kind == TokenKind::CloseObject || tok.kind == TokenKind::CloseArray) return unbalanced(tok, st);
      return unexpected(tok, st);
    }

    Frame& top = stack.back();
    switch (top.kind) {
      case FrameKind::InObject:
        switch (tok.kind) {
          case TokenKind::StringLiteral: {
            if (top.expect != Expect::KeyOrEnd && top.expect != Expect::Key) break;
            top.expect = Expect::CommaOrEnd;
            const std::size_t mark = path.size();
            if (!path.push_key(tok.text)) {
              return fail(ErrorCode::CapacityExceeded, tok.offset, "path longer than max_path_bytes", st);
            }
            stack.push_back(Frame{FrameKind::AfterKey, Expect::Colon, 0, mark});
            emit(out, EventKind::ObjectKey, tok);
            st = Status::Ok;
            return true;
          }
          case TokenKind::Comma:
            if (top.expect != Expect::CommaOrEnd) break;
            top.expect = Expect::Key;
            return false;
          case TokenKind::CloseObject:
            if (top.expect == Expect::Key) break; // trailing comma
            return end_container(EventKind::EndObject, tok, out, st);
          case TokenKind::CloseArray:
            return unbalanced(tok, st);
          default:
            break;
        }
        return unexpected(tok, st);

      case FrameKind::AfterKey:
        if (tok.kind == TokenKind::Colon && top.expect == Expect::Colon) {
          top.expect = Expect::Value;
          return false;
        }
        if (tok.is_value_start() && top.expect == Expect::Value) {
          top.expect = Expect::CommaOrEnd;
          return begin_value(tok, out, st);
        }
        if (tok.kind == TokenKind::CloseArray) return unbalanced(tok, st);
        return unexpected(tok, st);

      case FrameKind::InArray:
        if (tok.is_value_start() && (top.expect == Expect::ValueOrEnd || top.expect == Expect::Value)) {
          top.expect = Expect::CommaOrEnd;
          const std::uint64_t idx = top.index++;
          if (!path.push_index(idx)) {
            return fail(ErrorCode::CapacityExceeded, tok.offset, "path longer than max_path_bytes", st);
          }
          return begin_value(tok, out, st);
        }
        if (tok.kind == TokenKind::Comma && top.expect == Expect::CommaOrEnd) {
          top.expect = Expect::Value;
          return false;
        }
        if (tok.kind == TokenKind::CloseArray && top.expect != Expect::Value) {
          return end_container(EventKind::EndArray, tok, out, st);
        }
        if (tok.kind == TokenKind::CloseObject) return unbalanced(tok, st);
        return unexpected(tok, st);
    }
    return unexpected(tok, st);
  }

  Status next(std::string_view buf, Event& out) {
    if (failed) return Status::Error;
    if (ended || resting) return Status::EndOfDocument;
    apply_pending();

    Status st = Status::Ok;
    for (;;) {
      Token tok;
      switch (lexer.advance(buf, tok)) {
        case Status::Ok:
          break;
        case Status::NeedMoreData:
          // a partial token after the root must wait for more data or finish()
          if (!root_done || lexer.state() != LexerState::Base) return Status::NeedMoreData;
          resting = true;
          return Status::EndOfDocument;
        case Status::EndOfDocument:
          if (root_done) { ended = true; return Status::EndOfDocument; }
          fail(ErrorCode::UnexpectedEnd, lexer.offset(),
               stack.empty() ? "empty document" : "input ended inside a container", st);
          return st;
        case Status::Error:
          failed = true;
          err = lexer.error();
          err.path.assign(path.view().data(), path.view().size());
          return Status::Error;
      }

      if (tok.kind == TokenKind::WhiteSpace) continue;
      if (root_done) {
        fail(ErrorCode::UnexpectedToken, tok.offset, "content after the root value", st);
        return st;
      }
      if (dispatch(tok, out, st)) return st;
    }
  }
};

EventParser::EventParser() : EventParser(Config{}) {}
EventParser::EventParser(Config cfg) : p_(new Impl(cfg)) {}
EventParser::~EventParser() { delete p_; }

Status EventParser::next(std::string_view buffer, Event& out) { return p_->next(buffer, out); }

void EventParser::finish() noexcept { p_->lexer.finish(); }

// The drivers always hand over a fresh chunk, so a previous end at a chunk
// boundary is re-checked against it.
bool EventParser::feed(std::string_view chunk, const EventCallback& on_event) {
  p_->resting = false;
  Event ev;
  for (;;) {
    const Status st = p_->next(chunk, ev);
    if (st == Status::Ok) { on_event(ev); continue; }
    return st != Status::Error;
  }
}

bool EventParser::finish(const EventCallback& on_event) {
  finish();
  p_->resting = false;
  Event ev;
  for (;;) {
    const Status st = p_->next(std::string_view{}, ev);
    if (st == Status::Ok) { on_event(ev); continue; }
    return st == Status::EndOfDocument;
  }
}

void EventParser::reset() { p_->reset(); }

bool EventParser::done() const noexcept { return p_->root_done; }
std::size_t EventParser::depth() const noexcept { return p_->containers; }
std::string_view EventParser::path() const noexcept { return p_->path.view(); }
const Error& EventParser::error() const noexcept { return p_->err; }
std::string EventParser::error_message() const { return describe(p_->err); }
const Lexer& EventParser::lexer() const noexcept { return p_->lexer; }
const EventParser::Config& EventParser::config() const noexcept { return p_->cfg; }

}
