#ifndef ANCHORAGE_TRACKING_HIT_PICKING_HIT_PICKER_H
#define ANCHORAGE_TRACKING_HIT_PICKING_HIT_PICKER_H

// Include all hit picking policies
#include "hit_picker_base.h"
#include "layered_hit_picker.h"
#include "nearest_hit_picker.h"

#endif /* ANCHORAGE_TRACKING_HIT_PICKING_HIT_PICKER_H */
