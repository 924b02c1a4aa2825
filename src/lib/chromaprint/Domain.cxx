// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "Domain.hxx"
#include "util/Domain.hxx"

const Domain chromaprint_domain("chromaprint");
