#pragma once

#include "shard/Chunker.hh"
#include "shard/Digest.hh"
#include "shard/Frontend.hh"
#include "shard/Io.hh"
#include "shard/Normalizer.hh"
#include "shard/Paragraph.hh"
#include "shard/Record.hh"
#include "shard/Regex.hh"
#include "shard/Spans.hh"
#include "shard/Splitter.hh"
#include "shard/Text.hh"
#include "shard/Types.hh"
#include "shard/Utils.hh"
