#pragma once

#ifndef COMPONENTS_H
#define COMPONENTS_H

#include "Token.h"
#include "ParserErr.h"
#include "JsonValue.h"
#include "../scanner/TsonScanner.h"
#include "../parser/TsonParser.h"
#include "../parser/TsonRecord.h"
#include "../parser/TsonParse.h"

#endif
