#ifndef COMPACTFLOAT_CORE_STREAM_HPP
#define COMPACTFLOAT_CORE_STREAM_HPP

// Byte sinks and sources the codec reads from and writes to.
//
// A ByteSink accepts a run of bytes and says whether it took them all.
// A ByteSource hands out one byte at a time and returns false when it has
// nothing left. The codec never keeps a reference past the call.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace compactfloat {

template <typename S>
concept ByteSink = requires(S &Sink, const uint8_t *Data, size_t Size) {
  { Sink.write(Data, Size) } -> std::convertible_to<bool>;
};

template <typename S>
concept ByteSource = requires(S &Source, uint8_t &Byte) {
  { Source.next(Byte) } -> std::convertible_to<bool>;
};

// Appends to a growable vector.
class VectorSink {
public:
  explicit VectorSink(std::vector<uint8_t> &Out) : Out(Out) {}

  bool write(const uint8_t *Data, size_t Size) {
    Out.insert(Out.end(), Data, Data + Size);
    return true;
  }

private:
  std::vector<uint8_t> &Out;
};

class StreamSink {
public:
  explicit StreamSink(std::ostream &Out) : Out(Out) {}

  bool write(const uint8_t *Data, size_t Size) {
    Out.write(reinterpret_cast<const char *>(Data),
              static_cast<std::streamsize>(Size));
    return Out.good();
  }

private:
  std::ostream &Out;
};

// Reads from a caller-owned buffer and tracks how far it got.
class BufferSource {
public:
  explicit BufferSource(std::span<const uint8_t> Data) : Data(Data) {}

  bool next(uint8_t &Byte) {
    if (Pos >= Data.size())
      return false;
    Byte = Data[Pos++];
    return true;
  }

  size_t position() const { return Pos; }

private:
  std::span<const uint8_t> Data;
  size_t Pos = 0;
};

class StreamSource {
public:
  explicit StreamSource(std::istream &In) : In(In) {}

  bool next(uint8_t &Byte) {
    auto C = In.get();
    if (C == std::char_traits<char>::eof())
      return false;
    Byte = static_cast<uint8_t>(C);
    return true;
  }

private:
  std::istream &In;
};

static_assert(ByteSink<VectorSink>);
static_assert(ByteSink<StreamSink>);
static_assert(ByteSource<BufferSource>);
static_assert(ByteSource<StreamSource>);

} // namespace compactfloat

#endif // COMPACTFLOAT_CORE_STREAM_HPP
