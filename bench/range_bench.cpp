#include "gateway/range.hpp"
#include "storage/chunk_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <vector>

using namespace wttp;

// Random bytes; seed once in main so chunks differ.
static Bytes randomBytes(size_t size) {
  Bytes bytes(size);
  std::generate(bytes.begin(), bytes.end(),
                []() { return std::byte(std::rand() % 256); });
  return bytes;
}

static double elapsedSeconds(std::chrono::high_resolution_clock::time_point from) {
  return std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - from)
      .count();
}

int main() {
  std::srand(static_cast<unsigned int>(std::time(nullptr)));

  const size_t totalBytes = 256ULL * 1024 * 1024;
  const size_t chunkBytes = 1024 * 1024;
  const size_t numChunks = totalBytes / chunkBytes;

  std::cout << "Preparing " << numChunks << " chunks of "
            << chunkBytes / 1024 << " KiB..." << std::endl;
  std::vector<Bytes> source;
  source.reserve(numChunks);
  for (size_t i = 0; i < numChunks; ++i)
    source.push_back(randomBytes(chunkBytes));

  ChunkStore store;
  std::vector<Digest> addresses;
  std::vector<uint64_t> sizes;
  addresses.reserve(numChunks);
  sizes.reserve(numChunks);

  auto start = std::chrono::high_resolution_clock::now();
  for (const auto &chunk : source) {
    addresses.push_back(store.write(chunk));
    sizes.push_back(chunk.size());
  }
  double ingest = elapsedSeconds(start);
  std::cout << "Ingest: " << ingest << " s ("
            << (totalBytes / (1024.0 * 1024.0)) / ingest << " MiB/s)" << std::endl;

  ChunkLoader load = [&](size_t index) { return store.read(addresses[index]); };

  start = std::chrono::high_resolution_clock::now();
  auto full = resolveRange(Range{0, 0}, totalBytes);
  Bytes all = assembleBytes(sizes, load, *full);
  double readAll = elapsedSeconds(start);
  std::cout << "Full read: " << readAll << " s (" << all.size() << " bytes)"
            << std::endl;

  // Small windows straddling chunk boundaries.
  const int iterations = 10000;
  uint64_t copied = 0;
  start = std::chrono::high_resolution_clock::now();
  for (int i = 0; i < iterations; ++i) {
    int64_t from = static_cast<int64_t>((std::rand() % numChunks) * chunkBytes) - 512;
    if (from < 0)
      from = 0;
    auto window = resolveRange(Range{from, from + 4096}, totalBytes);
    if (!window)
      continue;
    copied += assembleBytes(sizes, load, *window).size();
  }
  double windows = elapsedSeconds(start);
  std::cout << "Range reads: " << iterations << " in " << windows << " s ("
            << copied << " bytes)" << std::endl;

  return 0;
}
