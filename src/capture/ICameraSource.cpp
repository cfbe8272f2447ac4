#include "capture/ICameraSource.h"
#include "capture/OpenCVCameraSource.h"

ICameraSource *ICameraSource::createDefault(QObject *parent)
{
    return new OpenCVCameraSource(parent);
}
