#pragma once

// Matroska/WebM 语义视图的聚合头文件。

#include "ebml/schema/chapters.hpp"
#include "ebml/schema/cluster.hpp"
#include "ebml/schema/cues.hpp"
#include "ebml/schema/ids.hpp"
#include "ebml/schema/registry.hpp"
#include "ebml/schema/segment.hpp"
#include "ebml/schema/tags.hpp"
#include "ebml/schema/tracks.hpp"
#include "ebml/schema/view.hpp"
