#pragma once
#include <iostream>
#include "cancellation.hpp"
#include "chunk-dictionary.hpp"
#include "config.hpp"

// chunk a file or stdin into an archive
void run_pack(const PackConfig &config, const CancellationToken &token);

// rebuild the source file of an archive
void run_unpack(const UnpackConfig &config, const CancellationToken &token);

// print what an archive holds
void run_info(const InfoConfig &config);

void print_dictionary_summary(std::ostream &out, const ChunkDictionary &dictionary);
