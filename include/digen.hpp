#pragma once

#include "digen/export.hpp"
#include "digen/fwd.hpp"
#include "digen/lifetime.hpp"
#include "digen/type_ref.hpp"
#include "digen/declaration.hpp"
#include "digen/descriptor.hpp"
#include "digen/diagnostic.hpp"
#include "digen/exceptions.hpp"
#include "digen/options.hpp"
#include "digen/extractor.hpp"
#include "digen/naming.hpp"
#include "digen/graph.hpp"
#include "digen/cycle_detector.hpp"
#include "digen/lifetime_validator.hpp"
#include "digen/registration_planner.hpp"
#include "digen/emitter.hpp"
#include "digen/generator.hpp"
#include "digen/snapshot.hpp"
