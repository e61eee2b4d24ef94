//
// Boson.hh
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#ifndef _BOSON_HH
#define _BOSON_HH

#include "boson/slice.hh"
#include "BosonException.hh"
#include "BSONSpec.hh"
#include "ObjectId.hh"
#include "DateTime.hh"
#include "Binary.hh"
#include "ExtendedTypes.hh"
#include "Bson.hh"
#include "RawDocument.hh"
#include "RawArray.hh"
#include "RawBsonRef.hh"
#include "RawDocumentBuf.hh"
#include "RawArrayBuf.hh"
#include "Serializer.hh"
#include "Deserializer.hh"
#include "Serde.hh"
#include "SerdeHelpers.hh"

#endif // _BOSON_HH
