//    --------------------------------------------------------------------
//
//    This file is part of fmill.
//
//    fmill is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    fmill is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with fmill. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#ifndef __FMILL_H__
#define __FMILL_H__

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "miscmath/miscmath.h"
#include "db/sqlwrap.h"
#include "dsp/standardize.h"
#include "param.h"

#include "mill/errors.h"
#include "mill/trial.h"
#include "mill/troughs.h"
#include "mill/classify.h"
#include "mill/bouts.h"
#include "mill/dtable.h"
#include "mill/aggregate.h"
#include "mill/report.h"
#include "mill/pipeline.h"
#include "mill/sweep.h"

#endif
