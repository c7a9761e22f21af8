/*
 * This file is part of the webdav-client package
 *
 * Copyright (C) 2025 Damien Caliste <dcaliste@free.fr>
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License
 * version 2.1 as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA
 */

#ifndef WEBDAV_DAVEXPORT_H
#define WEBDAV_DAVEXPORT_H

#include <QtGlobal>

#if defined(WEBDAV_LIBRARY)
#define WEBDAV_EXPORT Q_DECL_EXPORT
#else
#define WEBDAV_EXPORT Q_DECL_IMPORT
#endif

#endif
