#pragma once

#include <memory>
#include <string>
#include "text_engine.hpp"

namespace tesseract
{
    class TessBaseAPI;
}

class TesseractEngine : public TextEngine
{
public:
    TesseractEngine(const string &language = "eng", const string &tessdata_path = "");
    virtual ~TesseractEngine();

    virtual bool initialize() override;
    virtual bool isInitialized() const override { return initialized; }
    virtual vector<TextElement> recognize(const Mat &image) override;
    virtual string name() const override { return "tesseract"; }

protected:
    bool initialized;
    string language;
    string tessdata_path;
    unique_ptr<tesseract::TessBaseAPI> api;
};
